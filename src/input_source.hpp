/* input_source.hpp - input kinds, capabilities and loaded sources.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "content_node.hpp"
#include "html_document.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <wx/string.h>

enum class input_error_code {
	generic,
	unparseable_markup,
	invalid_tree,
	unsupported_kind
};

class input_exception : public std::runtime_error {
public:
	input_exception(const wxString& msg, input_error_code code = input_error_code::generic) : std::runtime_error(msg.ToStdString()), message{msg}, error_code{code} {
	}
	input_exception(const wxString& msg, const wxString& fp, input_error_code code = input_error_code::generic) : std::runtime_error(msg.ToStdString()), message{msg}, file_path{fp}, error_code{code} {
	}

	[[nodiscard]] const wxString& get_file_path() const noexcept {
		return file_path;
	}

	[[nodiscard]] const wxString& get_message() const noexcept {
		return message;
	}

	[[nodiscard]] wxString get_display_message() const {
		if (file_path.IsEmpty()) {
			return message;
		}
		return wxString::Format("%s: %s", file_path, message);
	}

	[[nodiscard]] input_error_code get_error_code() const noexcept {
		return error_code;
	}

private:
	wxString message;
	wxString file_path;
	input_error_code error_code;
};

enum class pipeline_stage {
	none = 0,
	chunk = 1 << 0,
	digest = 1 << 1,
};

inline constexpr pipeline_stage operator|(pipeline_stage a, pipeline_stage b) noexcept {
	return static_cast<pipeline_stage>(static_cast<int>(a) | static_cast<int>(b));
}

inline constexpr pipeline_stage operator&(pipeline_stage a, pipeline_stage b) noexcept {
	return static_cast<pipeline_stage>(static_cast<int>(a) & static_cast<int>(b));
}

inline constexpr pipeline_stage& operator|=(pipeline_stage& a, pipeline_stage b) noexcept {
	return a = a | b;
}

enum class input_kind {
	html,
	content_tree,
};

struct input_capability {
	wxString name;
	std::vector<wxString> extensions;
	pipeline_stage stages = pipeline_stage::none;

	[[nodiscard]] bool has_stage(pipeline_stage stage) const noexcept {
		return (stages & stage) == stage;
	}
};

using capability_map = std::map<input_kind, input_capability>;

[[nodiscard]] capability_map default_capabilities();
[[nodiscard]] std::optional<input_kind> find_kind_by_extension(const capability_map& capabilities, const wxString& extension);
// Looks at the first non-blank byte: '<' is markup, '{' is a content tree.
[[nodiscard]] std::optional<input_kind> sniff_input_kind(std::string_view content) noexcept;
// Accepts the names used on the command line, "html" and "tree".
[[nodiscard]] std::optional<input_kind> parse_input_kind(const wxString& name);
// Extension first, then content sniffing. Throws input_exception when neither is conclusive.
[[nodiscard]] input_kind detect_input_kind(const capability_map& capabilities, const wxString& path, std::string_view content);

struct html_source {
	html_document document;
	lxb_dom_node_t* root = nullptr;
};

struct tree_source {
	content_node tree;
};

using document_source = std::variant<html_source, tree_source>;

[[nodiscard]] content_node parse_content_tree(const std::string& content, const wxString& path = wxEmptyString);
// content must already be UTF-8.
[[nodiscard]] document_source load_source(input_kind kind, const std::string& content, const wxString& path, size_t root_min_text_length);
