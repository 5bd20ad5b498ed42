/* heading_level.hpp - heading detection and rank resolution.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <lexbor/dom/interfaces/element.h>
#include <optional>
#include <string_view>

[[nodiscard]] std::optional<int> tag_heading_level(std::string_view tag_name) noexcept;
// Integer parse with optional surrounding whitespace and sign; anything else is rejected.
[[nodiscard]] std::optional<int> parse_level_override(std::string_view value) noexcept;
// Tag-implied rank unless aria-level overrides it. role="heading" elements need an explicit aria-level.
[[nodiscard]] std::optional<int> get_heading_level(lxb_dom_element_t* element) noexcept;
[[nodiscard]] std::optional<int> get_heading_level(lxb_dom_node_t* node) noexcept;

[[nodiscard]] inline bool is_heading(lxb_dom_node_t* node) noexcept {
	return get_heading_level(node).has_value();
}
