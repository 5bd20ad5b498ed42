/* html_document.hpp - Lexbor document wrapper and DOM helpers.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include <cstddef>
#include <functional>
#include <lexbor/html/html.h>
#include <memory>
#include <string>
#include <string_view>

// Owns one parsed lexbor document. Every node handed out, fragments included, lives in its arena.
class html_document {
public:
	html_document();
	~html_document() = default;
	html_document(const html_document&) = delete;
	html_document& operator=(const html_document&) = delete;
	html_document(html_document&&) = default;
	html_document& operator=(html_document&&) = default;
	[[nodiscard]] bool parse(const std::string& html_content);
	[[nodiscard]] bool is_parsed() const noexcept { return parsed; }
	[[nodiscard]] lxb_dom_node_t* get_document_node() const noexcept;
	[[nodiscard]] lxb_dom_node_t* get_body() const noexcept;
	[[nodiscard]] lxb_dom_node_t* find_root_element(size_t min_text_length = DEFAULT_ROOT_MIN_TEXT_LENGTH) const;

private:
	struct DocumentDeleter {
		void operator()(lxb_html_document_t* doc) const noexcept {
			if (doc) {
				lxb_html_document_destroy(doc);
			}
		}
	};
	using DocumentPtr = std::unique_ptr<lxb_html_document_t, DocumentDeleter>;

	DocumentPtr doc;
	bool parsed = false;
};

struct fragment_deleter {
	void operator()(lxb_dom_node_t* node) const noexcept {
		if (node) {
			lxb_dom_node_destroy_deep(node);
		}
	}
};
using fragment_ptr = std::unique_ptr<lxb_dom_node_t, fragment_deleter>;

// Detached <div> owned by the caller; nodes are copied in with append_clone, never moved.
[[nodiscard]] fragment_ptr create_fragment(lxb_dom_document_t* owner);
void append_clone(lxb_dom_node_t* fragment, lxb_dom_node_t* node);

[[nodiscard]] inline bool is_element(const lxb_dom_node_t* node) noexcept {
	return node != nullptr && node->type == LXB_DOM_NODE_TYPE_ELEMENT;
}

// Elements whose content never counts as document text.
[[nodiscard]] bool is_excluded_tag(std::string_view tag) noexcept;
[[nodiscard]] std::string_view get_tag_name(lxb_dom_element_t* element) noexcept;
[[nodiscard]] std::string_view get_tag_name(lxb_dom_node_t* node) noexcept;
[[nodiscard]] std::string_view get_attribute(lxb_dom_element_t* element, std::string_view name) noexcept;
[[nodiscard]] std::string get_node_text(lxb_dom_node_t* node);
[[nodiscard]] std::string serialize_node(lxb_dom_node_t* node);
// Pre-order search over the descendants of root, root itself excluded.
[[nodiscard]] lxb_dom_node_t* find_first_element(lxb_dom_node_t* root, const std::function<bool(lxb_dom_node_t*)>& predicate);
