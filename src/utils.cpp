/* utils.cpp - various utility functions.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <cctype>
#include <cstddef>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <wx/strconv.h>
#include <wx/string.h>

namespace {
constexpr unsigned char UTF8_NBSP_FIRST = 0xC2;
constexpr unsigned char UTF8_NBSP_SECOND = 0xA0;
} // namespace

std::string collapse_whitespace(std::string_view input) {
	auto result = std::ostringstream{};
	bool prev_was_space = false;
	for (size_t i = 0; i < input.size(); ++i) {
		const auto ch = static_cast<unsigned char>(input[i]);
		// Check for non-breaking space (UTF-8: 0xC2A0)
		const bool is_nbsp = (i + 1 < input.size() && ch == UTF8_NBSP_FIRST && static_cast<unsigned char>(input[i + 1]) == UTF8_NBSP_SECOND);
		if ((std::isspace(ch) != 0) || is_nbsp) {
			if (!prev_was_space) {
				result << ' ';
				prev_was_space = true;
			}
			if (is_nbsp) {
				++i; // Skip the second byte of the UTF-8 sequence.
			}
		} else {
			result << input[i];
			prev_was_space = false;
		}
	}
	return result.str();
}

std::string trim_string(const std::string& str) {
	auto start = str.begin();
	auto end = str.end();
	auto is_nbsp = [&](std::string::const_iterator it) -> bool {
		return it != str.end() && std::next(it) != str.end() && static_cast<unsigned char>(*it) == UTF8_NBSP_FIRST && static_cast<unsigned char>(*std::next(it)) == UTF8_NBSP_SECOND;
	};
	while (start != end && ((std::isspace(static_cast<unsigned char>(*start)) != 0) || is_nbsp(start))) {
		if (is_nbsp(start)) {
			start += 2;
		} else {
			++start;
		}
	}
	while (start != end) {
		auto prev = std::prev(end);
		if (std::isspace(static_cast<unsigned char>(*prev)) != 0) {
			end = prev;
		} else if (prev != start && is_nbsp(std::prev(prev))) {
			end = std::prev(prev);
		} else {
			break;
		}
	}
	return {start, end};
}

std::string remove_soft_hyphens(std::string_view input) {
	std::string result(input);
	const std::string sh = "\xC2\xAD";
	size_t pos = 0;
	while ((pos = result.find(sh, pos)) != std::string::npos) {
		result.erase(pos, sh.size());
	}
	return result;
}

std::string convert_to_utf8(const std::string& input) {
	if (input.empty()) {
		return input;
	}
	const auto* data = reinterpret_cast<const unsigned char*>(input.data());
	const size_t len = input.length();
	auto try_convert = [&](size_t bom_size, wxMBConv& conv) -> std::optional<std::string> {
		const wxString content(input.data() + bom_size, conv, len - bom_size);
		if (!content.empty()) {
			return std::string(content.ToUTF8());
		}
		return std::nullopt;
	};
	if (len >= 4 && data[0] == 0xFF && data[1] == 0xFE && data[2] == 0x00 && data[3] == 0x00) {
		wxMBConvUTF32LE conv;
		if (auto result = try_convert(4, conv)) {
			return *result;
		}
	}
	if (len >= 4 && data[0] == 0x00 && data[1] == 0x00 && data[2] == 0xFE && data[3] == 0xFF) {
		wxMBConvUTF32BE conv;
		if (auto result = try_convert(4, conv)) {
			return *result;
		}
	}
	if (len >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
		return input.substr(3);
	}
	if (len >= 2 && data[0] == 0xFF && data[1] == 0xFE) {
		wxMBConvUTF16LE conv;
		if (auto result = try_convert(2, conv)) {
			return *result;
		}
	}
	if (len >= 2 && data[0] == 0xFE && data[1] == 0xFF) {
		wxMBConvUTF16BE conv;
		if (auto result = try_convert(2, conv)) {
			return *result;
		}
	}
	const std::pair<const char*, wxMBConv*> fallback_encodings[] = {
		{nullptr, nullptr}, // UTF-8 without BOM
		{"windows-1252", nullptr},
		{"iso-8859-1", &wxConvISO8859_1},
	};
	for (const auto& [name, conv] : fallback_encodings) {
		wxString content;
		if (name == nullptr) {
			content = wxString::FromUTF8(input.data(), len);
		} else if (conv != nullptr) {
			content = wxString(input.data(), *conv, len);
		} else {
			const wxCSConv csconv(name);
			content = wxString(input.data(), csconv, len);
		}
		if (!content.empty()) {
			return std::string(content.ToUTF8());
		}
	}
	return input;
}

std::string read_stream(wxInputStream& stream) {
	constexpr int buffer_size = 4096;
	std::ostringstream buffer;
	char buf[buffer_size];
	while (stream.Read(buf, sizeof(buf)).LastRead() > 0) {
		buffer.write(buf, static_cast<std::streamsize>(stream.LastRead()));
	}
	return buffer.str();
}

void write_string(wxOutputStream& stream, std::string_view text) {
	if (text.empty()) {
		return;
	}
	stream.Write(text.data(), text.size());
	if (stream.LastWrite() != text.size()) {
		throw std::runtime_error("Failed to write output");
	}
}

std::vector<std::string> split_lines(std::string_view text) {
	std::vector<std::string> lines;
	size_t start = 0;
	for (size_t i = 0; i < text.size(); ++i) {
		if (text[i] != '\n' && text[i] != '\r') {
			continue;
		}
		lines.emplace_back(text.substr(start, i - start));
		if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
			++i;
		}
		start = i + 1;
	}
	if (start < text.size()) {
		lines.emplace_back(text.substr(start));
	}
	return lines;
}

size_t utf8_length(const std::string& str) {
	return wxString::FromUTF8(str.data(), str.size()).length();
}

std::string escape_html(std::string_view text) {
	std::string out;
	out.reserve(text.size());
	for (const char ch : text) {
		switch (ch) {
			case '&':
				out += "&amp;";
				break;
			case '<':
				out += "&lt;";
				break;
			case '>':
				out += "&gt;";
				break;
			default:
				out.push_back(ch);
				break;
		}
	}
	return out;
}

std::string to_hex(const unsigned char* data, size_t len) {
	static constexpr char digits[] = "0123456789abcdef";
	std::string out;
	out.reserve(len * 2);
	for (size_t i = 0; i < len; ++i) {
		out.push_back(digits[(data[i] >> 4) & 0xF]);
		out.push_back(digits[data[i] & 0xF]);
	}
	return out;
}
