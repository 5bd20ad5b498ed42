/* digest_flattener.cpp - digest flattening and tree reassembly.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "digest_flattener.hpp"
#include "input_source.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <wx/translation.h>

void to_json(nlohmann::json& j, const digest_node& node) {
	j = nlohmann::json{
		{"digest_hash", node.digest_hash},
		{"parent_digest_hash", nullptr},
		{"title", node.title},
		{"text", node.text},
		{"section_digest", node.digest},
	};
	if (node.parent_digest_hash) {
		j["parent_digest_hash"] = *node.parent_digest_hash;
	}
}

void from_json(const nlohmann::json& j, digest_node& node) {
	node.digest_hash = j.at("digest_hash").get<std::string>();
	node.parent_digest_hash.reset();
	if (const auto it = j.find("parent_digest_hash"); it != j.end() && !it->is_null()) {
		node.parent_digest_hash = it->get<std::string>();
	}
	node.title = j.value("title", std::string{});
	node.text = j.value("text", std::string{});
	node.digest = j.value("section_digest", section_digest{});
}

void digest_flattener::flatten(const content_node& root, const emit_callback& emit) const {
	flatten_node(root, std::nullopt, emit);
}

std::vector<digest_node> digest_flattener::flatten(const content_node& root) const {
	std::vector<digest_node> nodes;
	nodes.reserve(root.count_nodes());
	flatten(root, [&nodes](const digest_node& node) {
		nodes.push_back(node);
	});
	return nodes;
}

void digest_flattener::flatten_node(const content_node& node, const std::optional<std::string>& parent_hash, const emit_callback& emit) const {
	digest_node flat;
	flat.digest = make_section_digest(node, line_cap);
	flat.digest_hash = compute_digest_hash(flat.digest);
	flat.parent_digest_hash = parent_hash;
	flat.title = node.title;
	flat.text = node.text;
	emit(flat);
	const std::optional<std::string> own_hash = flat.digest_hash;
	for (const auto& child : node.subsections) {
		flatten_node(child, own_hash, emit);
	}
}

content_node rebuild_tree(const std::vector<digest_node>& nodes) {
	if (nodes.empty()) {
		throw input_exception(_("No digest nodes to rebuild"), input_error_code::invalid_tree);
	}
	const auto& first = nodes.front();
	if (!first.is_root()) {
		throw input_exception(_("First digest node is not a root"), input_error_code::invalid_tree);
	}
	content_node root{first.title, first.text, std::nullopt, {}};
	// Open ancestors of the next node, innermost last.
	std::vector<std::pair<const std::string*, content_node*>> open{{&first.digest_hash, &root}};
	for (size_t i = 1; i < nodes.size(); ++i) {
		const auto& node = nodes[i];
		if (node.is_root()) {
			throw input_exception(_("Digest sequence contains more than one root"), input_error_code::invalid_tree);
		}
		while (!open.empty() && *open.back().first != *node.parent_digest_hash) {
			open.pop_back();
		}
		if (open.empty()) {
			throw input_exception(wxString::Format(_("Parent digest %s not found"), wxString::FromUTF8(*node.parent_digest_hash)), input_error_code::invalid_tree);
		}
		auto& siblings = open.back().second->subsections;
		siblings.push_back({node.title, node.text, std::nullopt, {}});
		open.emplace_back(&node.digest_hash, &siblings.back());
	}
	return root;
}
