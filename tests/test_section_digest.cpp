/* test_section_digest.cpp - section digest and hashing tests.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "section_digest.hpp"
#include <algorithm>
#include <cctype>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace {
content_node titled(const std::string& title, const std::string& text = "") {
	return content_node{title, text, std::nullopt, {}};
}

bool is_lower_hex(const std::string& value) {
	return std::all_of(value.begin(), value.end(), [](char ch) {
		return std::isdigit(static_cast<unsigned char>(ch)) != 0 || (ch >= 'a' && ch <= 'f');
	});
}
} // namespace

TEST(ShortenTextTest, NegativeCapKeepsEverything) {
	EXPECT_EQ(shorten_text("a\nb\nc", NO_LINE_LIMIT, {}), "a\nb\nc");
	EXPECT_EQ(shorten_text("", NO_LINE_LIMIT, {titled("X")}), "");
}

TEST(ShortenTextTest, EmptyTextListsSubsections) {
	const auto result = shorten_text("", 1, {titled("X")});
	EXPECT_FALSE(result.empty());
	EXPECT_EQ(result, "<p>Covered topics in this subsection:</p><ul><li>X</li></ul>");
}

TEST(ShortenTextTest, ListingEscapesTitles) {
	const auto result = shorten_text("", 1, {titled("A & B"), titled("<C>")});
	EXPECT_EQ(result, "<p>Covered topics in this subsection:</p><ul><li>A &amp; B</li><li>&lt;C&gt;</li></ul>");
}

TEST(ShortenTextTest, EmptyTextWithoutSubsectionsStaysEmpty) {
	EXPECT_EQ(shorten_text("", 1, {}), "");
}

TEST(ShortenTextTest, TruncatesToCap) {
	EXPECT_EQ(shorten_text("l1\nl2\nl3", 1, {}), "l1...");
	EXPECT_EQ(shorten_text("l1\nl2\nl3", 2, {}), "l1l2...");
}

TEST(ShortenTextTest, WithinCapKeepsAllLines) {
	EXPECT_EQ(shorten_text("l1\r\nl2", 2, {}), "l1l2");
	EXPECT_EQ(shorten_text("only", 1, {}), "only");
}

TEST(ShortenTextTest, WithinCapMarksDeeperContent) {
	EXPECT_EQ(shorten_text("only", 1, {titled("child")}), "only...");
}

TEST(ShortenTextTest, ZeroCapKeepsOnlyMarker) {
	EXPECT_EQ(shorten_text("a\nb", 0, {}), "...");
}

TEST(ShortenTextTest, HandlesAllLineBreakStyles) {
	EXPECT_EQ(shorten_text("a\rb\r\nc\nd", 3, {}), "abc...");
}

TEST(MakeSectionDigestTest, ShortensChildrenWhenParentHasText) {
	content_node node{"Parent", "<p>intro</p>", 1, {titled("C1", "line1\nline2"), titled("C2", "single")}};
	const auto digest = make_section_digest(node);
	EXPECT_EQ(digest.title, "Parent");
	EXPECT_EQ(digest.text, "<p>intro</p>");
	ASSERT_EQ(digest.subsections.size(), 2u);
	EXPECT_EQ(digest.subsections[0], (digest_child{"C1", "line1..."}));
	EXPECT_EQ(digest.subsections[1], (digest_child{"C2", "single"}));
}

TEST(MakeSectionDigestTest, KeepsFullChildTextWhenParentIsEmpty) {
	content_node node{"", "", std::nullopt, {titled("C1", "line1\nline2")}};
	const auto digest = make_section_digest(node);
	ASSERT_EQ(digest.subsections.size(), 1u);
	EXPECT_EQ(digest.subsections[0].text, "line1\nline2");
}

TEST(MakeSectionDigestTest, UsesConfiguredLineCap) {
	content_node node{"P", "text", 1, {titled("C", "a\nb\nc")}};
	EXPECT_EQ(make_section_digest(node, 2).subsections[0].text, "ab...");
}

TEST(MakeSectionDigestTest, ListsGrandchildrenForEmptyChild) {
	content_node child{"Child", "", 2, {titled("Grandchild")}};
	content_node node{"P", "text", 1, {child}};
	EXPECT_EQ(make_section_digest(node).subsections[0].text, "<p>Covered topics in this subsection:</p><ul><li>Grandchild</li></ul>");
}

TEST(CanonicalFormTest, SortsKeysCompactly) {
	const section_digest digest{"T", "x", {{"c", "y"}}};
	EXPECT_EQ(canonical_form(digest), R"({"subsections":[{"text":"y","title":"c"}],"text":"x","title":"T"})");
}

TEST(CanonicalFormTest, InvalidUtf8IsProgrammerError) {
	const section_digest digest{"\xff\xfe", "", {}};
	EXPECT_THROW((void)canonical_form(digest), digest_error);
	EXPECT_THROW((void)compute_digest_hash(digest), digest_error);
}

TEST(DigestHashTest, IsLowercaseHexOf128Bits) {
	const auto hash = compute_digest_hash(section_digest{"T", "x", {}});
	EXPECT_EQ(hash.size(), 32u);
	EXPECT_TRUE(is_lower_hex(hash));
}

TEST(DigestHashTest, MatchesKnownValue) {
	const section_digest digest{"T", "<p>A</p>", {{"S1", "<p>B</p>"}, {"S2", "<p>C</p>"}}};
	EXPECT_EQ(compute_digest_hash(digest), "8537fca7ce7db905a5372d2747d73fa5");
	EXPECT_EQ(compute_digest_hash(section_digest{}), "74bf4c5becda90b1dc8faed0020ffff8");
}

TEST(DigestHashTest, IsDeterministic) {
	const section_digest digest{"Title", "Body", {{"Child", "Short"}}};
	EXPECT_EQ(compute_digest_hash(digest), compute_digest_hash(digest));
	const section_digest copy = digest;
	EXPECT_EQ(compute_digest_hash(copy), compute_digest_hash(digest));
}

TEST(DigestHashTest, EveryFieldAffectsHash) {
	const section_digest base{"Title", "Body", {{"Child", "Short"}}};
	const auto base_hash = compute_digest_hash(base);
	auto changed = base;
	changed.title = "Title2";
	EXPECT_NE(compute_digest_hash(changed), base_hash);
	changed = base;
	changed.text = "Body2";
	EXPECT_NE(compute_digest_hash(changed), base_hash);
	changed = base;
	changed.subsections[0].title = "Other";
	EXPECT_NE(compute_digest_hash(changed), base_hash);
	changed = base;
	changed.subsections[0].text = "Longer";
	EXPECT_NE(compute_digest_hash(changed), base_hash);
	changed = base;
	changed.subsections.push_back({"Extra", ""});
	EXPECT_NE(compute_digest_hash(changed), base_hash);
}

TEST(DigestJsonTest, RoundTripsThroughJson) {
	const section_digest digest{"T", "x", {{"c", "y"}}};
	const nlohmann::json j = digest;
	EXPECT_EQ(j.get<section_digest>(), digest);
	EXPECT_EQ(nlohmann::json::parse(R"({"title":"only"})").get<section_digest>(), (section_digest{"only", "", {}}));
}
