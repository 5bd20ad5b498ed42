/* input_source.cpp - input kind detection and source loading.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "input_source.hpp"
#include "utils.hpp"
#include <cctype>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <wx/filename.h>
#include <wx/translation.h>

capability_map default_capabilities() {
	capability_map capabilities;
	capabilities[input_kind::html] = {"HTML Documents", {"htm", "html", "xhtml"}, pipeline_stage::chunk | pipeline_stage::digest};
	capabilities[input_kind::content_tree] = {"Content Trees", {"json"}, pipeline_stage::digest};
	return capabilities;
}

std::optional<input_kind> find_kind_by_extension(const capability_map& capabilities, const wxString& extension) {
	const wxString normalized = extension.Lower();
	for (const auto& [kind, capability] : capabilities) {
		for (const auto& ext : capability.extensions) {
			if (ext.Lower() == normalized) {
				return kind;
			}
		}
	}
	return std::nullopt;
}

std::optional<input_kind> sniff_input_kind(std::string_view content) noexcept {
	for (const char ch : content) {
		if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
			continue;
		}
		if (ch == '<') {
			return input_kind::html;
		}
		if (ch == '{') {
			return input_kind::content_tree;
		}
		return std::nullopt;
	}
	return std::nullopt;
}

std::optional<input_kind> parse_input_kind(const wxString& name) {
	const wxString normalized = name.Lower();
	if (normalized == "html") {
		return input_kind::html;
	}
	if (normalized == "tree") {
		return input_kind::content_tree;
	}
	return std::nullopt;
}

input_kind detect_input_kind(const capability_map& capabilities, const wxString& path, std::string_view content) {
	if (!path.IsEmpty()) {
		if (const auto kind = find_kind_by_extension(capabilities, wxFileName(path).GetExt())) {
			return *kind;
		}
	}
	if (const auto kind = sniff_input_kind(content)) {
		if (capabilities.contains(*kind)) {
			return *kind;
		}
	}
	throw input_exception(_("Unable to determine the input type"), path, input_error_code::unsupported_kind);
}

content_node parse_content_tree(const std::string& content, const wxString& path) {
	try {
		return nlohmann::json::parse(content).get<content_node>();
	} catch (const nlohmann::json::exception& e) {
		throw input_exception(wxString::Format(_("Invalid content tree: %s"), wxString::FromUTF8(e.what())), path, input_error_code::invalid_tree);
	}
}

document_source load_source(input_kind kind, const std::string& content, const wxString& path, size_t root_min_text_length) {
	if (trim_string(content).empty()) {
		throw input_exception(_("Input is empty"), path);
	}
	if (kind == input_kind::content_tree) {
		return tree_source{parse_content_tree(content, path)};
	}
	try {
		html_source source;
		if (!source.document.parse(content)) {
			throw input_exception(_("Failed to parse HTML"), path, input_error_code::unparseable_markup);
		}
		source.root = source.document.find_root_element(root_min_text_length);
		return document_source{std::move(source)};
	} catch (const input_exception&) {
		throw;
	} catch (const std::runtime_error& e) {
		throw input_exception(wxString::FromUTF8(e.what()), path, input_error_code::unparseable_markup);
	}
}
