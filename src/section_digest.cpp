/* section_digest.cpp - digest truncation, canonical form and BLAKE2b hashing.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "section_digest.hpp"
#include "utils.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <string>
#include <string_view>
#include <vector>

namespace {
struct mac_deleter {
	void operator()(EVP_MAC* mac) const noexcept {
		EVP_MAC_free(mac);
	}
};

struct mac_ctx_deleter {
	void operator()(EVP_MAC_CTX* ctx) const noexcept {
		EVP_MAC_CTX_free(ctx);
	}
};

using mac_ptr = std::unique_ptr<EVP_MAC, mac_deleter>;
using mac_ctx_ptr = std::unique_ptr<EVP_MAC_CTX, mac_ctx_deleter>;
} // namespace

void to_json(nlohmann::json& j, const digest_child& child) {
	j = nlohmann::json{{"title", child.title}, {"text", child.text}};
}

void from_json(const nlohmann::json& j, digest_child& child) {
	child.title = j.value("title", std::string{});
	child.text = j.value("text", std::string{});
}

void to_json(nlohmann::json& j, const section_digest& digest) {
	j = nlohmann::json{
		{"title", digest.title},
		{"text", digest.text},
		{"subsections", digest.subsections},
	};
}

void from_json(const nlohmann::json& j, section_digest& digest) {
	digest.title = j.value("title", std::string{});
	digest.text = j.value("text", std::string{});
	digest.subsections.clear();
	if (const auto it = j.find("subsections"); it != j.end() && !it->is_null()) {
		digest.subsections = it->get<std::vector<digest_child>>();
	}
}

std::string shorten_text(std::string_view text, int line_cap, const std::vector<content_node>& subsections) {
	if (line_cap < 0) {
		return std::string(text);
	}
	if (text.empty()) {
		if (subsections.empty()) {
			return {};
		}
		std::string listing(COVERED_TOPICS_HEADER);
		listing += "<ul>";
		for (const auto& child : subsections) {
			listing += "<li>" + escape_html(child.title) + "</li>";
		}
		listing += "</ul>";
		return listing;
	}
	const auto lines = split_lines(text);
	const auto cap = static_cast<size_t>(line_cap);
	const bool truncated = lines.size() > cap;
	const size_t kept = truncated ? cap : lines.size();
	std::string result;
	for (size_t i = 0; i < kept; ++i) {
		result += lines[i];
	}
	if (truncated || !subsections.empty()) {
		result += ELLIPSIS_MARKER;
	}
	return result;
}

section_digest make_section_digest(const content_node& node, int line_cap) {
	section_digest digest{node.title, node.text, {}};
	const int cap = node.text.empty() ? NO_LINE_LIMIT : line_cap;
	digest.subsections.reserve(node.subsections.size());
	for (const auto& child : node.subsections) {
		digest.subsections.push_back({child.title, shorten_text(child.text, cap, child.subsections)});
	}
	return digest;
}

std::string canonical_form(const section_digest& digest) {
	try {
		return nlohmann::json(digest).dump();
	} catch (const nlohmann::json::type_error& e) {
		throw digest_error(std::string("Section digest cannot be serialized: ") + e.what());
	}
}

std::string compute_digest_hash(const section_digest& digest) {
	const auto payload = canonical_form(digest);
	const mac_ptr mac{EVP_MAC_fetch(nullptr, "BLAKE2BMAC", nullptr)};
	if (!mac) {
		throw digest_error("BLAKE2b MAC is not available");
	}
	const mac_ctx_ptr ctx{EVP_MAC_CTX_new(mac.get())};
	if (!ctx) {
		throw digest_error("Failed to create digest context");
	}
	size_t digest_size = DIGEST_SIZE;
	const OSSL_PARAM params[] = {
		OSSL_PARAM_construct_size_t(OSSL_MAC_PARAM_SIZE, &digest_size),
		OSSL_PARAM_construct_end(),
	};
	const auto* key = reinterpret_cast<const unsigned char*>(DIGEST_KEY.data());
	if (EVP_MAC_init(ctx.get(), key, DIGEST_KEY.size(), params) != 1) {
		throw digest_error("Failed to initialise digest");
	}
	if (EVP_MAC_update(ctx.get(), reinterpret_cast<const unsigned char*>(payload.data()), payload.size()) != 1) {
		throw digest_error("Failed to update digest");
	}
	unsigned char out[DIGEST_SIZE];
	size_t out_len = 0;
	if (EVP_MAC_final(ctx.get(), out, &out_len, sizeof(out)) != 1 || out_len != DIGEST_SIZE) {
		throw digest_error("Failed to finalise digest");
	}
	return to_hex(out, out_len);
}
