/* pipeline.cpp - runs chunking and flattening for one document.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pipeline.hpp"
#include "digest_flattener.hpp"
#include "section_chunker.hpp"
#include "utils.hpp"
#include <limits>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <variant>
#include <wx/log.h>
#include <wx/translation.h>

namespace {
constexpr int PRETTY_INDENT = 2;

struct tree_builder {
	const section_chunker& chunker;

	content_node operator()(const html_source& source) const {
		return chunker.chunk(source.root);
	}

	content_node operator()(const tree_source& source) const {
		return source.tree;
	}
};
} // namespace

std::optional<output_mode> parse_output_mode(const wxString& name) {
	const wxString normalized = name.Lower();
	if (normalized == "tree") {
		return output_mode::tree;
	}
	if (normalized == "digest") {
		return output_mode::digest;
	}
	return std::nullopt;
}

std::optional<int> parse_line_cap(long value) noexcept {
	if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
		return std::nullopt;
	}
	return static_cast<int>(value);
}

document_processor::document_processor(capability_map capabilities, processing_options options) : capabilities{std::move(capabilities)}, options{std::move(options)} {
}

void document_processor::process(const wxString& path, const std::string& raw_content, wxOutputStream& out) const {
	const wxString display_path = path.IsEmpty() ? wxString(_("standard input")) : path;
	const std::string content = convert_to_utf8(raw_content);
	const input_kind kind = resolve_kind(path, content);
	const auto& capability = capabilities.at(kind);
	const bool needs_chunk = options.mode == output_mode::tree || kind == input_kind::html;
	if (needs_chunk && !capability.has_stage(pipeline_stage::chunk)) {
		throw input_exception(wxString::Format(_("%s cannot be chunked"), capability.name), path, input_error_code::unsupported_kind);
	}
	if (options.mode == output_mode::digest && !capability.has_stage(pipeline_stage::digest)) {
		throw input_exception(wxString::Format(_("%s cannot be digested"), capability.name), path, input_error_code::unsupported_kind);
	}
	wxLogVerbose(_("Processing %s as %s (%lu bytes)"), display_path, capability.name, static_cast<unsigned long>(content.size()));
	const auto source = load_source(kind, content, path, options.root_min_text_length);
	const content_node tree = build_tree(source);
	wxLogVerbose(_("Built %lu sections from %s"), static_cast<unsigned long>(tree.count_nodes()), display_path);
	if (options.mode == output_mode::tree) {
		write_tree(tree, out);
	} else {
		write_digest(tree, out);
	}
	wxLogVerbose(_("Finished %s"), display_path);
}

content_node document_processor::build_tree(const document_source& source) const {
	const section_chunker chunker;
	return std::visit(tree_builder{chunker}, source);
}

input_kind document_processor::resolve_kind(const wxString& path, const std::string& content) const {
	if (options.forced_kind) {
		if (!capabilities.contains(*options.forced_kind)) {
			throw input_exception(_("Requested input type is not supported"), path, input_error_code::unsupported_kind);
		}
		return *options.forced_kind;
	}
	return detect_input_kind(capabilities, path, content);
}

void document_processor::write_tree(const content_node& tree, wxOutputStream& out) const {
	const nlohmann::json j = tree;
	write_string(out, j.dump(options.pretty ? PRETTY_INDENT : -1) + "\n");
}

void document_processor::write_digest(const content_node& tree, wxOutputStream& out) const {
	const digest_flattener flattener{options.digest_line_cap};
	flattener.flatten(tree, [&out](const digest_node& node) {
		const nlohmann::json j = node;
		write_string(out, j.dump() + "\n");
	});
}
