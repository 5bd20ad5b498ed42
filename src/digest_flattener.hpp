/* digest_flattener.hpp - flattens section trees into hash-linked digest nodes.
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
#include "section_digest.hpp"
#include <functional>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

struct digest_node {
	std::string digest_hash;
	std::optional<std::string> parent_digest_hash;
	std::string title;
	std::string text;
	section_digest digest;

	[[nodiscard]] bool is_root() const noexcept {
		return !parent_digest_hash.has_value();
	}

	bool operator==(const digest_node& other) const = default;
};

void to_json(nlohmann::json& j, const digest_node& node);
void from_json(const nlohmann::json& j, digest_node& node);

class digest_flattener {
public:
	using emit_callback = std::function<void(const digest_node&)>;

	explicit digest_flattener(int line_cap = DEFAULT_DIGEST_LINE_CAP) noexcept : line_cap{line_cap} {}

	// Pre-order. Each node is handed to emit before any of its subsections is hashed.
	void flatten(const content_node& root, const emit_callback& emit) const;
	[[nodiscard]] std::vector<digest_node> flatten(const content_node& root) const;
	[[nodiscard]] int get_line_cap() const noexcept {
		return line_cap;
	}

private:
	int line_cap;

	void flatten_node(const content_node& node, const std::optional<std::string>& parent_hash, const emit_callback& emit) const;
};

// Reassembles the hierarchy from a pre-order sequence using hash linkage alone. Levels are not recoverable.
[[nodiscard]] content_node rebuild_tree(const std::vector<digest_node>& nodes);
