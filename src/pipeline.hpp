/* pipeline.hpp - per-document processing pipeline.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include "content_node.hpp"
#include "input_source.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <wx/stream.h>
#include <wx/string.h>

enum class output_mode {
	tree,
	digest,
};

[[nodiscard]] std::optional<output_mode> parse_output_mode(const wxString& name);
// Empty when value does not fit an int.
[[nodiscard]] std::optional<int> parse_line_cap(long value) noexcept;

struct processing_options {
	size_t root_min_text_length = DEFAULT_ROOT_MIN_TEXT_LENGTH;
	int digest_line_cap = DEFAULT_DIGEST_LINE_CAP;
	bool pretty = false;
	output_mode mode = output_mode::digest;
	std::optional<input_kind> forced_kind;
};

// Runs one document through chunking and flattening. Holds no per-document state.
class document_processor {
public:
	document_processor(capability_map capabilities, processing_options options);

	// raw_content may be in any encoding convert_to_utf8 understands. Throws input_exception or digest_error.
	void process(const wxString& path, const std::string& raw_content, wxOutputStream& out) const;
	[[nodiscard]] content_node build_tree(const document_source& source) const;

private:
	capability_map capabilities;
	processing_options options;

	[[nodiscard]] input_kind resolve_kind(const wxString& path, const std::string& content) const;
	void write_tree(const content_node& tree, wxOutputStream& out) const;
	void write_digest(const content_node& tree, wxOutputStream& out) const;
};
