/* constants.hpp - application-wide constants.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "version.h"
#include <cstddef>
#include <string_view>
#include <wx/string.h>

inline const wxString APP_NAME = "Folio";
inline const wxString APP_VERSION = wxString::FromUTF8(FOLIO_VERSION_STRING);
inline const wxString CONFIG_FILE_NAME = "folio.ini";
inline constexpr int MAX_TAG_HEADING_LEVEL = 6;
inline constexpr int DEFAULT_ROOT_MIN_TEXT_LENGTH = 100;
inline constexpr int DEFAULT_DIGEST_LINE_CAP = 1;
// Passed as a line cap, disables truncation entirely.
inline constexpr int NO_LINE_LIMIT = -1;
inline constexpr size_t DIGEST_SIZE = 16;
inline constexpr std::string_view DIGEST_KEY = "folio.section-digest";
inline constexpr std::string_view ELLIPSIS_MARKER = "...";
inline constexpr std::string_view COVERED_TOPICS_HEADER = "<p>Covered topics in this subsection:</p>";

enum config_version {
	CONFIG_VERSION_LEGACY = 0,
	CONFIG_VERSION_1 = 1,
	CONFIG_VERSION_CURRENT = CONFIG_VERSION_1
};
