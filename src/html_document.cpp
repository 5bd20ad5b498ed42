/* html_document.cpp - Lexbor document wrapper, root selection and DOM helpers.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "html_document.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <lexbor/dom/dom.h>
#include <lexbor/html/serialize.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {
constexpr std::array<std::string_view, 9> excluded_tags = {"head", "script", "style", "noscript", "template", "meta", "link", "title", "base"};

lxb_dom_node_t* find_first_in(lxb_dom_node_t* node, const std::function<bool(lxb_dom_node_t*)>& predicate) {
	for (auto* child = node->first_child; child != nullptr; child = child->next) {
		if (!is_element(child)) {
			continue;
		}
		if (predicate(child)) {
			return child;
		}
		if (auto* found = find_first_in(child, predicate)) {
			return found;
		}
	}
	return nullptr;
}

bool has_visible_text(lxb_dom_node_t* node) {
	return !trim_string(get_node_text(node)).empty();
}

size_t visible_text_length(lxb_dom_node_t* node) {
	return utf8_length(trim_string(get_node_text(node)));
}

// Like find_first_in, but never looks inside excluded elements.
lxb_dom_node_t* find_content_block(lxb_dom_node_t* node, size_t min_text_length) {
	for (auto* child = node->first_child; child != nullptr; child = child->next) {
		if (!is_element(child)) {
			continue;
		}
		const auto tag = get_tag_name(child);
		if (is_excluded_tag(tag)) {
			continue;
		}
		if (tag != "html" && tag != "body" && visible_text_length(child) > min_text_length) {
			return child;
		}
		if (auto* found = find_content_block(child, min_text_length)) {
			return found;
		}
	}
	return nullptr;
}
} // namespace

html_document::html_document() : doc{lxb_html_document_create()} {
	if (!doc) {
		throw std::runtime_error("Failed to create Lexbor HTML document");
	}
}

bool html_document::parse(const std::string& html_content) {
	const lxb_status_t status = lxb_html_document_parse(doc.get(), reinterpret_cast<const lxb_char_t*>(html_content.data()), html_content.length());
	parsed = status == LXB_STATUS_OK;
	return parsed;
}

lxb_dom_node_t* html_document::get_document_node() const noexcept {
	return lxb_dom_interface_node(doc.get());
}

lxb_dom_node_t* html_document::get_body() const noexcept {
	auto* body = lxb_html_document_body_element(doc.get());
	return body != nullptr ? lxb_dom_interface_node(body) : nullptr;
}

lxb_dom_node_t* html_document::find_root_element(size_t min_text_length) const {
	auto* document = get_document_node();
	auto* main = find_first_element(document, [](lxb_dom_node_t* node) {
		return get_tag_name(node) == "main" || trim_string(std::string(get_attribute(lxb_dom_interface_element(node), "role"))) == "main";
	});
	if (main != nullptr && has_visible_text(main)) {
		return main;
	}
	auto* article = find_first_element(document, [](lxb_dom_node_t* node) {
		return get_tag_name(node) == "article" || trim_string(std::string(get_attribute(lxb_dom_interface_element(node), "role"))) == "article";
	});
	if (article != nullptr && has_visible_text(article)) {
		return article;
	}
	auto* body = get_body();
	if (body != nullptr && has_visible_text(body)) {
		return body;
	}
	auto* section = find_first_element(document, [](lxb_dom_node_t* node) { return get_tag_name(node) == "section"; });
	if (section != nullptr && has_visible_text(section)) {
		return section;
	}
	auto* content_block = find_content_block(document, min_text_length);
	if (content_block != nullptr) {
		return content_block;
	}
	return document;
}

fragment_ptr create_fragment(lxb_dom_document_t* owner) {
	static constexpr std::string_view tag = "div";
	auto* element = lxb_dom_document_create_element(owner, reinterpret_cast<const lxb_char_t*>(tag.data()), tag.size(), nullptr);
	if (element == nullptr) {
		throw std::runtime_error("Failed to create fragment element");
	}
	return fragment_ptr{lxb_dom_interface_node(element)};
}

void append_clone(lxb_dom_node_t* fragment, lxb_dom_node_t* node) {
	auto* clone = lxb_dom_document_import_node(fragment->owner_document, node, true);
	if (clone == nullptr) {
		throw std::runtime_error("Failed to clone node into fragment");
	}
	lxb_dom_node_insert_child(fragment, clone);
}

bool is_excluded_tag(std::string_view tag) noexcept {
	return std::find(excluded_tags.begin(), excluded_tags.end(), tag) != excluded_tags.end();
}

std::string_view get_tag_name(lxb_dom_element_t* element) noexcept {
	if (element == nullptr) {
		return {};
	}
	size_t len = 0;
	const lxb_char_t* name = lxb_dom_element_local_name(element, &len);
	if (name == nullptr) {
		return {};
	}
	return {reinterpret_cast<const char*>(name), len};
}

std::string_view get_tag_name(lxb_dom_node_t* node) noexcept {
	if (!is_element(node)) {
		return {};
	}
	return get_tag_name(lxb_dom_interface_element(node));
}

std::string_view get_attribute(lxb_dom_element_t* element, std::string_view name) noexcept {
	if (element == nullptr) {
		return {};
	}
	size_t len = 0;
	const lxb_char_t* value = lxb_dom_element_get_attribute(element, reinterpret_cast<const lxb_char_t*>(name.data()), name.size(), &len);
	if (value == nullptr) {
		return {};
	}
	return {reinterpret_cast<const char*>(value), len};
}

std::string get_node_text(lxb_dom_node_t* node) {
	if (node == nullptr) {
		return {};
	}
	size_t len = 0;
	lxb_char_t* text = lxb_dom_node_text_content(node, &len);
	if (text == nullptr) {
		return {};
	}
	std::string result(reinterpret_cast<const char*>(text), len);
	lxb_dom_document_destroy_text(node->owner_document, text);
	return result;
}

std::string serialize_node(lxb_dom_node_t* node) {
	if (node == nullptr) {
		return {};
	}
	lexbor_str_t str = {0};
	const lxb_status_t status = lxb_html_serialize_tree_str(node, &str);
	std::string result;
	if (str.data != nullptr && str.length > 0) {
		result.assign(reinterpret_cast<const char*>(str.data), str.length);
	}
	if (str.data != nullptr) {
		lexbor_str_destroy(&str, node->owner_document->text, false);
	}
	if (status != LXB_STATUS_OK) {
		throw std::runtime_error("Failed to serialize node");
	}
	return result;
}

lxb_dom_node_t* find_first_element(lxb_dom_node_t* root, const std::function<bool(lxb_dom_node_t*)>& predicate) {
	if (root == nullptr) {
		return nullptr;
	}
	return find_first_in(root, predicate);
}
