/* section_chunker.cpp - splits markup into nested heading-delimited sections.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "section_chunker.hpp"
#include "heading_level.hpp"
#include "html_document.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace {
void visit_headings(lxb_dom_node_t* node, std::vector<lxb_dom_node_t*>& headings) {
	for (auto* child = node->first_child; child != nullptr; child = child->next) {
		if (!is_element(child)) {
			continue;
		}
		if (is_heading(child)) {
			headings.push_back(child);
		} else {
			visit_headings(child, headings);
		}
	}
}

bool closes_section(lxb_dom_node_t* sibling, int rank) {
	if (!is_element(sibling)) {
		return false;
	}
	if (const auto level = get_heading_level(sibling)) {
		return *level <= rank;
	}
	const auto nested = collect_headings(sibling);
	return std::any_of(nested.begin(), nested.end(), [rank](lxb_dom_node_t* heading) {
		return *get_heading_level(heading) <= rank;
	});
}

void append_content(lxb_dom_node_t* node, const std::unordered_set<lxb_dom_node_t*>& skipped, std::vector<std::string>& pieces);

void append_children(lxb_dom_node_t* parent, const std::unordered_set<lxb_dom_node_t*>& skipped, std::vector<std::string>& pieces) {
	for (auto* child = parent->first_child; child != nullptr; child = child->next) {
		append_content(child, skipped, pieces);
	}
}

void append_content(lxb_dom_node_t* node, const std::unordered_set<lxb_dom_node_t*>& skipped, std::vector<std::string>& pieces) {
	if (skipped.contains(node)) {
		return;
	}
	if (node->type == LXB_DOM_NODE_TYPE_TEXT) {
		if (!trim_string(get_node_text(node)).empty()) {
			pieces.push_back(trim_string(serialize_node(node)));
		}
		return;
	}
	if (!is_element(node) || is_heading(node) || is_excluded_tag(get_tag_name(node))) {
		return;
	}
	const auto tag = get_tag_name(node);
	if (tag == "html" || tag == "body" || contains_heading(node)) {
		append_children(node, skipped, pieces);
		return;
	}
	if (trim_string(get_node_text(node)).empty()) {
		return;
	}
	pieces.push_back(serialize_node(node));
}

std::string join_pieces(const std::vector<std::string>& pieces) {
	std::string result;
	for (const auto& piece : pieces) {
		if (!result.empty()) {
			result += '\n';
		}
		result += piece;
	}
	return trim_string(result);
}
} // namespace

std::vector<lxb_dom_node_t*> collect_headings(lxb_dom_node_t* root) {
	std::vector<lxb_dom_node_t*> headings;
	if (root != nullptr) {
		visit_headings(root, headings);
	}
	return headings;
}

bool contains_heading(lxb_dom_node_t* node) {
	for (auto* child = node->first_child; child != nullptr; child = child->next) {
		if (is_heading(child) || (is_element(child) && contains_heading(child))) {
			return true;
		}
	}
	return false;
}

std::string heading_title(lxb_dom_node_t* heading) {
	return trim_string(collapse_whitespace(remove_soft_hyphens(get_node_text(heading))));
}

std::vector<lxb_dom_node_t*> section_range(lxb_dom_node_t* heading) {
	std::vector<lxb_dom_node_t*> range;
	const auto rank = get_heading_level(heading);
	if (!rank) {
		return range;
	}
	for (auto* sibling = heading->next; sibling != nullptr; sibling = sibling->next) {
		if (closes_section(sibling, *rank)) {
			break;
		}
		range.push_back(sibling);
	}
	return range;
}

std::string collect_content(lxb_dom_node_t* container, const std::unordered_set<lxb_dom_node_t*>& skipped) {
	std::vector<std::string> pieces;
	if (container != nullptr) {
		append_children(container, skipped, pieces);
	}
	return join_pieces(pieces);
}

content_node section_chunker::chunk(lxb_dom_node_t* root) const {
	if (root == nullptr) {
		return {};
	}
	if (is_heading(root)) {
		return chunk_heading_root(root);
	}
	return chunk_container(root);
}

content_node section_chunker::chunk_heading_root(lxb_dom_node_t* heading) const {
	return chunk_section(heading, section_range(heading));
}

content_node section_chunker::chunk_section(lxb_dom_node_t* heading, const std::vector<lxb_dom_node_t*>& range) const {
	const bool nested = std::any_of(range.begin(), range.end(), [](lxb_dom_node_t* node) {
		return is_heading(node) || (is_element(node) && contains_heading(node));
	});
	if (!nested) {
		std::vector<std::string> pieces;
		for (auto* node : range) {
			append_content(node, {}, pieces);
		}
		return {heading_title(heading), join_pieces(pieces), get_heading_level(heading), {}};
	}
	auto fragment = create_fragment(heading->owner_document);
	append_clone(fragment.get(), heading);
	for (auto* node : range) {
		append_clone(fragment.get(), node);
	}
	return chunk_container(fragment.get());
}

content_node section_chunker::chunk_container(lxb_dom_node_t* container) const {
	const auto headings = collect_headings(container);
	if (headings.empty()) {
		return {"", collect_content(container), std::nullopt, {}};
	}
	if (headings.size() == 1) {
		auto* heading = headings.front();
		return {heading_title(heading), collect_content(container), get_heading_level(heading), {}};
	}
	return chunk_composite(container, headings);
}

content_node section_chunker::chunk_composite(lxb_dom_node_t* container, const std::vector<lxb_dom_node_t*>& headings) const {
	std::vector<int> ranks;
	ranks.reserve(headings.size());
	for (auto* heading : headings) {
		ranks.push_back(*get_heading_level(heading));
	}
	const int min_rank = *std::min_element(ranks.begin(), ranks.end());
	const auto top_count = std::count(ranks.begin(), ranks.end(), min_rank);
	content_node node;
	lxb_dom_node_t* anchor = nullptr;
	long long anchor_rank = static_cast<long long>(min_rank) - 1;
	if (top_count == 1) {
		const auto index = static_cast<size_t>(std::find(ranks.begin(), ranks.end(), min_rank) - ranks.begin());
		anchor = headings[index];
		anchor_rank = min_rank;
		node.title = heading_title(anchor);
		node.level = min_rank;
	}
	node_set claimed_headings;
	node_set skipped;
	if (anchor != nullptr) {
		skipped.insert(anchor);
	}
	std::vector<std::pair<lxb_dom_node_t*, std::vector<lxb_dom_node_t*>>> boundaries;
	for (size_t i = 0; i < headings.size(); ++i) {
		auto* candidate = headings[i];
		if (candidate == anchor || claimed_headings.contains(candidate) || ranks[i] <= anchor_rank) {
			continue;
		}
		bool owned_by_intermediate = false;
		for (size_t j = 0; j < i; ++j) {
			if (headings[j] == anchor || claimed_headings.contains(headings[j])) {
				continue;
			}
			if (ranks[j] > anchor_rank && ranks[j] < ranks[i]) {
				owned_by_intermediate = true;
				break;
			}
		}
		if (owned_by_intermediate) {
			continue;
		}
		auto range = section_range(candidate);
		claimed_headings.insert(candidate);
		skipped.insert(candidate);
		for (auto* member : range) {
			skipped.insert(member);
			if (is_heading(member)) {
				claimed_headings.insert(member);
			} else if (is_element(member)) {
				for (auto* inner : collect_headings(member)) {
					claimed_headings.insert(inner);
				}
			}
		}
		boundaries.emplace_back(candidate, std::move(range));
	}
	node.text = collect_content(container, skipped);
	node.subsections.reserve(boundaries.size());
	for (const auto& [boundary, range] : boundaries) {
		node.subsections.push_back(chunk_section(boundary, range));
	}
	return node;
}
