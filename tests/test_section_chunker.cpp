/* test_section_chunker.cpp - section chunker tests.
 *
 * Folio.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "heading_level.hpp"
#include "html_document.hpp"
#include "section_chunker.hpp"
#include <gtest/gtest.h>
#include <optional>
#include <string>

namespace {
content_node leaf(const std::string& title, const std::string& text, std::optional<int> level) {
	return content_node{title, text, level, {}};
}
} // namespace

class SectionChunkerTest : public ::testing::Test {
protected:
	html_document doc;
	section_chunker chunker;

	content_node chunk_html(const std::string& html) {
		EXPECT_TRUE(doc.parse(html));
		return chunker.chunk(doc.find_root_element());
	}
};

TEST_F(SectionChunkerTest, NestsEqualRankSectionsUnderTopHeading) {
	const auto result = chunk_html("<h1>T</h1><p>A</p><h2>S1</h2><p>B</p><h2>S2</h2><p>C</p>");
	const content_node expected{"T", "<p>A</p>", 1, {leaf("S1", "<p>B</p>", 2), leaf("S2", "<p>C</p>", 2)}};
	EXPECT_EQ(result, expected);
}

TEST_F(SectionChunkerTest, SingleHeadingIsBaseCase) {
	const auto result = chunk_html("<h2>Only</h2><p>one</p><p>two</p>");
	EXPECT_EQ(result, leaf("Only", "<p>one</p>\n<p>two</p>", 2));
	EXPECT_TRUE(result.subsections.empty());
}

TEST_F(SectionChunkerTest, SingleHeadingKeepsSurroundingContent) {
	const auto result = chunk_html("<p>before</p><h2>H</h2><p>after</p>");
	EXPECT_EQ(result, leaf("H", "<p>before</p>\n<p>after</p>", 2));
}

TEST_F(SectionChunkerTest, StrictlyDeeperHeadingsFormChain) {
	const auto result = chunk_html("<h1>A</h1><p>a</p><h2>B</h2><p>b</p><h3>C</h3><p>c</p>");
	const content_node expected{"A", "<p>a</p>", 1, {content_node{"B", "<p>b</p>", 2, {leaf("C", "<p>c</p>", 3)}}}};
	EXPECT_EQ(result, expected);
}

TEST_F(SectionChunkerTest, NoHeadingsYieldsUntitledNode) {
	const auto result = chunk_html("<p>x</p><ul><li>y</li></ul>");
	EXPECT_EQ(result, leaf("", "<p>x</p>\n<ul><li>y</li></ul>", std::nullopt));
	EXPECT_FALSE(result.has_heading());
}

TEST_F(SectionChunkerTest, TiedTopRankBecomesSiblings) {
	const auto result = chunk_html("<h2>A</h2><p>a</p><h2>B</h2><p>b</p>");
	const content_node expected{"", "", std::nullopt, {leaf("A", "<p>a</p>", 2), leaf("B", "<p>b</p>", 2)}};
	EXPECT_EQ(result, expected);
}

TEST_F(SectionChunkerTest, TiedTopRankKeepsNestedChildren) {
	const auto result = chunk_html("<h2>A</h2><h3>a1</h3><p>x</p><h2>B</h2>");
	ASSERT_EQ(result.subsections.size(), 2u);
	EXPECT_EQ(result.subsections[0].title, "A");
	ASSERT_EQ(result.subsections[0].subsections.size(), 1u);
	EXPECT_EQ(result.subsections[0].subsections[0], leaf("a1", "<p>x</p>", 3));
	EXPECT_EQ(result.subsections[1], leaf("B", "", 2));
}

TEST_F(SectionChunkerTest, OverrideRankChangesBoundaries) {
	const auto result = chunk_html(R"(<h1>T</h1><h2 aria-level="7">X</h2><p>x</p><h3>Y</h3><p>y</p>)");
	const content_node expected{"T", "", 1, {leaf("X", "<p>x</p>", 7), leaf("Y", "<p>y</p>", 3)}};
	EXPECT_EQ(result, expected);
}

TEST_F(SectionChunkerTest, WithoutOverrideSameMarkupNests) {
	const auto result = chunk_html("<h1>T</h1><h2>X</h2><p>x</p><h3>Y</h3><p>y</p>");
	const content_node expected{"T", "", 1, {content_node{"X", "<p>x</p>", 2, {leaf("Y", "<p>y</p>", 3)}}}};
	EXPECT_EQ(result, expected);
}

TEST_F(SectionChunkerTest, MalformedOverrideUsesTagRank) {
	const auto result = chunk_html(R"(<h1>T</h1><h2 aria-level="abc">S</h2><p>s</p>)");
	ASSERT_EQ(result.subsections.size(), 1u);
	EXPECT_EQ(result.subsections[0], leaf("S", "<p>s</p>", 2));
}

TEST_F(SectionChunkerTest, InterveningMarkupDoesNotNestSiblings) {
	const auto result = chunk_html("<h1>T</h1><h2>A</h2><div><p>a</p></div><section><p>aside</p></section><h2>B</h2><p>b</p>");
	ASSERT_EQ(result.subsections.size(), 2u);
	EXPECT_EQ(result.subsections[0], leaf("A", "<div><p>a</p></div>\n<section><p>aside</p></section>", 2));
	EXPECT_EQ(result.subsections[1], leaf("B", "<p>b</p>", 2));
}

TEST_F(SectionChunkerTest, WrapperHoldingHeadingIsRoutedToSubsection) {
	const auto result = chunk_html(R"(<h1>T</h1><p>intro</p><div class="wrap"><h2>S</h2><p>s</p></div><p>outro</p>)");
	const content_node expected{"T", "<p>intro</p>\n<p>outro</p>", 1, {leaf("S", "<p>s</p>", 2)}};
	EXPECT_EQ(result, expected);
}

TEST_F(SectionChunkerTest, ExcludedElementsAreDropped) {
	const auto result = chunk_html("<h1>T</h1><script>var x = 1;</script><style>p { color: red; }</style><noscript>enable js</noscript><p>kept</p>");
	EXPECT_EQ(result, leaf("T", "<p>kept</p>", 1));
}

TEST_F(SectionChunkerTest, HeadScriptNeverLeaksIntoText) {
	const auto result = chunk_html("<html><head><script>var s = '" + std::string(150, 'x') + "';</script></head><body></body></html>");
	EXPECT_EQ(result, leaf("", "", std::nullopt));
}

TEST_F(SectionChunkerTest, DocumentRootSkipsHead) {
	ASSERT_TRUE(doc.parse("<html><head><title>Page</title><style>p {}</style></head><body><p>x</p></body></html>"));
	EXPECT_EQ(chunker.chunk(doc.get_document_node()), leaf("", "<p>x</p>", std::nullopt));
}

TEST_F(SectionChunkerTest, BlankElementsAreDropped) {
	const auto result = chunk_html("<h1>T</h1><div>   </div><p></p><p>kept</p>");
	EXPECT_EQ(result.text, "<p>kept</p>");
}

TEST_F(SectionChunkerTest, LooseTextIsEscapedAndKept) {
	const auto result = chunk_html("<h1>T</h1>  loose &amp; text  <p>p</p>");
	EXPECT_EQ(result.text, "loose &amp; text\n<p>p</p>");
}

TEST_F(SectionChunkerTest, HeadingBeforeAnchorBecomesSubsection) {
	const auto result = chunk_html("<h3>Pre</h3><p>p</p><h1>Main</h1><p>m</p>");
	const content_node expected{"Main", "<p>m</p>", 1, {leaf("Pre", "<p>p</p>", 3)}};
	EXPECT_EQ(result, expected);
}

TEST_F(SectionChunkerTest, TitleWhitespaceIsCollapsed) {
	const auto result = chunk_html("<h1>  Hello\n   <em>World</em> </h1><p>x</p>");
	EXPECT_EQ(result.title, "Hello World");
}

TEST_F(SectionChunkerTest, HeadingsInsideHeadingsAreTitleText) {
	const auto result = chunk_html(R"(<h1>Outer <span role="heading" aria-level="2">inner</span></h1><p>x</p>)");
	EXPECT_EQ(result, leaf("Outer inner", "<p>x</p>", 1));
}

TEST_F(SectionChunkerTest, HeadingRootStopsAtEqualRank) {
	ASSERT_TRUE(doc.parse("<h1>A</h1><p>a</p><h2>B</h2><p>b</p><h1>Next</h1><p>n</p>"));
	auto* heading = find_first_element(doc.get_document_node(), [](lxb_dom_node_t* node) {
		return is_heading(node);
	});
	ASSERT_NE(heading, nullptr);
	const auto result = chunker.chunk(heading);
	const content_node expected{"A", "<p>a</p>", 1, {leaf("B", "<p>b</p>", 2)}};
	EXPECT_EQ(result, expected);
}

TEST_F(SectionChunkerTest, ChunkingLeavesSourceTreeIntact) {
	const std::string html = "<h1>A</h1><p>a</p><h2>B</h2><p>b</p><h3>C</h3><p>c</p>";
	ASSERT_TRUE(doc.parse(html));
	auto* root = doc.find_root_element();
	const auto before = serialize_node(root);
	const auto first = chunker.chunk(root);
	EXPECT_EQ(serialize_node(root), before);
	EXPECT_EQ(chunker.chunk(root), first);
}

TEST(SectionRangeTest, StopsAtWrapperHoldingCloser) {
	html_document doc;
	ASSERT_TRUE(doc.parse("<h2>A</h2><p>a</p><div><h1>Up</h1></div><p>z</p>"));
	auto* heading = find_first_element(doc.get_document_node(), [](lxb_dom_node_t* node) {
		return is_heading(node);
	});
	ASSERT_NE(heading, nullptr);
	const auto range = section_range(heading);
	ASSERT_EQ(range.size(), 1u);
	EXPECT_EQ(serialize_node(range.front()), "<p>a</p>");
}

TEST(SectionRangeTest, DeeperHeadingsStayInside) {
	html_document doc;
	ASSERT_TRUE(doc.parse("<h2>A</h2><h3>B</h3><div><h4>C</h4></div><h2>D</h2>"));
	auto* heading = find_first_element(doc.get_document_node(), [](lxb_dom_node_t* node) {
		return is_heading(node);
	});
	ASSERT_NE(heading, nullptr);
	EXPECT_EQ(section_range(heading).size(), 2u);
	EXPECT_EQ(collect_headings(doc.get_body()).size(), 4u);
}
