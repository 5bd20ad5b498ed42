/* heading_level.cpp - heading rank resolution with aria-level overrides.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "heading_level.hpp"
#include "constants.hpp"
#include "html_document.hpp"
#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>

namespace {
constexpr bool is_space(char ch) noexcept {
	return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

std::string_view trim_view(std::string_view value) noexcept {
	while (!value.empty() && is_space(value.front())) {
		value.remove_prefix(1);
	}
	while (!value.empty() && is_space(value.back())) {
		value.remove_suffix(1);
	}
	return value;
}
} // namespace

std::optional<int> tag_heading_level(std::string_view tag_name) noexcept {
	if (tag_name.size() != 2 || (tag_name[0] != 'h' && tag_name[0] != 'H')) {
		return std::nullopt;
	}
	const int level = tag_name[1] - '0';
	if (level < 1 || level > MAX_TAG_HEADING_LEVEL) {
		return std::nullopt;
	}
	return level;
}

std::optional<int> parse_level_override(std::string_view value) noexcept {
	value = trim_view(value);
	if (value.empty()) {
		return std::nullopt;
	}
	if (value.front() == '+') {
		value.remove_prefix(1);
		if (value.empty() || value.front() == '-') {
			return std::nullopt;
		}
	}
	int level = 0;
	const auto* end = value.data() + value.size();
	const auto [ptr, ec] = std::from_chars(value.data(), end, level);
	if (ec != std::errc{} || ptr != end) {
		return std::nullopt;
	}
	return level;
}

std::optional<int> get_heading_level(lxb_dom_element_t* element) noexcept {
	if (element == nullptr) {
		return std::nullopt;
	}
	const auto override_level = parse_level_override(get_attribute(element, "aria-level"));
	if (const auto tag_level = tag_heading_level(get_tag_name(element))) {
		return override_level ? override_level : tag_level;
	}
	if (trim_view(get_attribute(element, "role")) == "heading") {
		return override_level;
	}
	return std::nullopt;
}

std::optional<int> get_heading_level(lxb_dom_node_t* node) noexcept {
	if (!is_element(node)) {
		return std::nullopt;
	}
	return get_heading_level(lxb_dom_interface_element(node));
}
