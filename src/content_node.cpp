/* content_node.cpp - JSON conversion for section tree nodes.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "content_node.hpp"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

size_t content_node::count_nodes() const noexcept {
	size_t total = 1;
	for (const auto& child : subsections) {
		total += child.count_nodes();
	}
	return total;
}

void to_json(nlohmann::json& j, const content_node& node) {
	j = nlohmann::json{
		{"title", node.title},
		{"text", node.text},
		{"level", nullptr},
		{"subsections", node.subsections},
	};
	if (node.level) {
		j["level"] = *node.level;
	}
}

void from_json(const nlohmann::json& j, content_node& node) {
	node.title = j.value("title", std::string{});
	node.text = j.value("text", std::string{});
	node.level.reset();
	if (const auto it = j.find("level"); it != j.end() && !it->is_null()) {
		node.level = it->get<int>();
	}
	node.subsections.clear();
	if (const auto it = j.find("subsections"); it != j.end() && !it->is_null()) {
		node.subsections = it->get<std::vector<content_node>>();
	}
}
