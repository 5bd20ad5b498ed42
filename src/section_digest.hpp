/* section_digest.hpp - section digests and content hashing.
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
#include <nlohmann/json_fwd.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

class digest_error : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

struct digest_child {
	std::string title;
	std::string text;

	bool operator==(const digest_child& other) const = default;
};

// Bounded view of a node: its own title and text plus the shortened text of each direct child.
struct section_digest {
	std::string title;
	std::string text;
	std::vector<digest_child> subsections;

	bool operator==(const section_digest& other) const = default;
};

void to_json(nlohmann::json& j, const digest_child& child);
void from_json(const nlohmann::json& j, digest_child& child);
void to_json(nlohmann::json& j, const section_digest& digest);
void from_json(const nlohmann::json& j, section_digest& digest);

// A negative line_cap keeps the text whole. Empty text with subsections becomes a listing of their titles.
[[nodiscard]] std::string shorten_text(std::string_view text, int line_cap, const std::vector<content_node>& subsections);
// Children are shortened to line_cap lines when node has text of its own, otherwise kept whole.
[[nodiscard]] section_digest make_section_digest(const content_node& node, int line_cap = DEFAULT_DIGEST_LINE_CAP);
// Compact JSON with sorted keys. Throws digest_error when the digest holds invalid UTF-8.
[[nodiscard]] std::string canonical_form(const section_digest& digest);
// Keyed BLAKE2b-128 of canonical_form, as 32 lowercase hex characters.
[[nodiscard]] std::string compute_digest_hash(const section_digest& digest);
