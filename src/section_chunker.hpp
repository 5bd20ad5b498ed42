/* section_chunker.hpp - heading-driven section chunker.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "content_node.hpp"
#include <lexbor/dom/interfaces/node.h>
#include <string>
#include <unordered_set>
#include <vector>

// Splits a markup subtree into heading-delimited sections.
class section_chunker {
public:
	// root is a heading, a container element, a fragment or the document node.
	[[nodiscard]] content_node chunk(lxb_dom_node_t* root) const;

private:
	using node_set = std::unordered_set<lxb_dom_node_t*>;

	[[nodiscard]] content_node chunk_heading_root(lxb_dom_node_t* heading) const;
	[[nodiscard]] content_node chunk_section(lxb_dom_node_t* heading, const std::vector<lxb_dom_node_t*>& range) const;
	[[nodiscard]] content_node chunk_container(lxb_dom_node_t* container) const;
	[[nodiscard]] content_node chunk_composite(lxb_dom_node_t* container, const std::vector<lxb_dom_node_t*>& headings) const;
};

// Headings under root in document order. Elements inside a heading are part of its title and are not visited.
[[nodiscard]] std::vector<lxb_dom_node_t*> collect_headings(lxb_dom_node_t* root);
[[nodiscard]] bool contains_heading(lxb_dom_node_t* node);
[[nodiscard]] std::string heading_title(lxb_dom_node_t* heading);
// Following siblings owned by heading: stops before a sibling heading of equal or higher rank,
// or a sibling element that holds one.
[[nodiscard]] std::vector<lxb_dom_node_t*> section_range(lxb_dom_node_t* heading);
// Own content of container, skipping headings, excluded nodes and anything in skipped.
[[nodiscard]] std::string collect_content(lxb_dom_node_t* container, const std::unordered_set<lxb_dom_node_t*>& skipped = {});
