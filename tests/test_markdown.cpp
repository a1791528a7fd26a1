/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "markdown.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace rendar;

namespace {

std::string identity(std::string_view dest) { return std::string(dest); }

bool contains(const std::string &text, std::string_view needle) {
  return text.find(needle) != std::string::npos;
}

} // namespace

TEST(FrontMatter, ParsesKeysAndMode) {
  auto [fm, body] =
      parseFrontMatter("---\ntitle: Example\nmode: Slides\nowner: \"Jane Doe\"\n"
                       "---\n# Heading\n");
  ASSERT_EQ(fm.entries.size(), 3u);
  EXPECT_EQ(fm.entries[0].first, "title");
  EXPECT_EQ(fm.entries[0].second, "Example");
  EXPECT_EQ(fm.entries[2].second, "Jane Doe");
  ASSERT_TRUE(fm.mode);
  EXPECT_EQ(*fm.mode, "slides");
  EXPECT_TRUE(fm.isSlides());
  EXPECT_EQ(body, "# Heading\n");
}

TEST(FrontMatter, UnterminatedBlockIsBody) {
  std::string_view text = "---\ntitle: x\n# Heading\n";
  auto [fm, body] = parseFrontMatter(text);
  EXPECT_TRUE(fm.entries.empty());
  EXPECT_FALSE(fm.mode);
  EXPECT_EQ(body, text);
}

TEST(FrontMatter, AbsentWhenFirstLineIsNotADelimiter) {
  auto [fm, body] = parseFrontMatter("# Title\n---\nmode: slides\n---\n");
  EXPECT_FALSE(fm.isSlides());
  EXPECT_EQ(body, "# Title\n---\nmode: slides\n---\n");
}

TEST(Markdown, RendersGithubDialect) {
  std::string html = markdownToHtml(
      "# Title\n\n- [x] done\n- [ ] open\n\n| a | b |\n|---|--:|\n| 1 | 2 |\n\n"
      "~~gone~~ <b>raw</b>\n",
      identity);
  EXPECT_TRUE(contains(html, "<h1>Title</h1>"));
  EXPECT_TRUE(contains(html, "class=\"task-list-item-checkbox\" disabled checked>"));
  EXPECT_TRUE(contains(html, "class=\"task-list-item-checkbox\" disabled>"));
  EXPECT_TRUE(contains(html, "<table>"));
  EXPECT_TRUE(contains(html, "<th align=\"right\">b</th>"));
  EXPECT_TRUE(contains(html, "<del>gone</del>"));
  EXPECT_TRUE(contains(html, "<b>raw</b>"));
}

TEST(Markdown, EscapesText) {
  std::string html = markdownToHtml("a < b & c\n", identity);
  EXPECT_TRUE(contains(html, "a &lt; b &amp; c"));
}

TEST(Markdown, RewritesMermaidCodeFences) {
  std::string html =
      markdownToHtml("```mermaid\ngraph TD;\n  A-->B;\n```\n", identity);
  std::string rewritten = rewriteMermaidBlocks(html);
  EXPECT_TRUE(contains(rewritten, "<pre class=\"mermaid\">"));
  EXPECT_TRUE(contains(rewritten, "graph TD;"));
  EXPECT_FALSE(contains(rewritten, "language-mermaid"));
}

TEST(Markdown, KeepsOtherCodeFences) {
  std::string html = markdownToHtml("```cpp\nint x;\n```\n", identity);
  EXPECT_EQ(rewriteMermaidBlocks(html), html);
  EXPECT_TRUE(contains(html, "<pre><code class=\"language-cpp\">"));
}

TEST(Markdown, PassesLinksThroughRewriter) {
  std::vector<std::string> seen;
  std::string html = markdownToHtml(
      "[Doc](guide/intro.md) ![img](logo.png)\n", [&](std::string_view dest) {
        seen.emplace_back(dest);
        return std::string("rewritten.html");
      });
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0], "guide/intro.md");
  EXPECT_TRUE(contains(html, "<a href=\"rewritten.html\">Doc</a>"));
  EXPECT_TRUE(contains(html, "<img src=\"logo.png\" alt=\"img\">"));
}

TEST(Markdown, UsesFirstHeadingAsTitle) {
  EXPECT_EQ(firstHeadingTitle("# First Title\n\n## Second Title\n"),
            "First Title");
  EXPECT_EQ(firstHeadingTitle("Intro\n\n## Sub *one*\n"), "Sub one");
  EXPECT_FALSE(firstHeadingTitle("No heading here.\n"));
}

TEST(Markdown, IgnoresFrontMatterInTitle) {
  EXPECT_EQ(firstHeadingTitle("---\nmode: slides\n---\n# Deck Title\n"),
            "Deck Title");
}

TEST(Markdown, SplitsSlidesOnH1) {
  std::string html =
      markdownToSlides("# One\n\nIntro\n\n# Two\n\nMore\n", identity);
  EXPECT_TRUE(contains(html, "data-slide-count=\"2\""));
  EXPECT_TRUE(contains(html, "id=\"slide-1\""));
  EXPECT_TRUE(contains(html, "id=\"slide-2\""));
  EXPECT_TRUE(contains(html, "class=\"slide is-active\""));
  EXPECT_TRUE(contains(html, "aria-hidden=\"true\""));
  EXPECT_TRUE(contains(html, "<div class=\"slides-progress\">1 / 2</div>"));
  EXPECT_LT(html.find("One"), html.find("Two"));
}

TEST(Markdown, ContentBeforeFirstHeadingStaysOnFirstSlide) {
  std::string html =
      markdownToSlides("Preface\n\n# One\n\n## Sub\n\n# Two\n", identity);
  EXPECT_TRUE(contains(html, "data-slide-count=\"2\""));
  std::size_t second = html.find("id=\"slide-2\"");
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(html.find("Preface"), second);
  EXPECT_LT(html.find("<h2>Sub</h2>"), second);
}

TEST(Markdown, EmptyDeckHasOneSlide) {
  std::string html = markdownToSlides("", identity);
  EXPECT_TRUE(contains(html, "data-slide-count=\"1\""));
}

TEST(Markdown, FrontMatterTableEscapesValues) {
  FrontMatter fm;
  EXPECT_FALSE(frontMatterTableHtml(fm));
  fm.entries.emplace_back("owner", "<Jane>");
  auto table = frontMatterTableHtml(fm);
  ASSERT_TRUE(table);
  EXPECT_TRUE(contains(*table, "<td>owner</td><td>&lt;Jane&gt;</td>"));
}

TEST(MarkdownFile, RendersFrontMatterTableBeforeHeading) {
  test::TempDir dir;
  test::writeText(dir / "note.md",
                  "---\ntitle: Example\nowner: \"Jane Doe\"\n---\n# Heading\n");
  RenderedPage page = renderMarkdownFile(dir.path(), "note.md", {});
  EXPECT_EQ(page.mode, DocMode::Document);
  std::size_t table = page.html.find("front-matter-table");
  std::size_t heading = page.html.find("<h1>");
  ASSERT_NE(table, std::string::npos);
  ASSERT_NE(heading, std::string::npos);
  EXPECT_LT(table, heading);
  EXPECT_TRUE(contains(page.html, "<td>title</td>"));
  EXPECT_TRUE(contains(page.html, "<td>Example</td>"));
  EXPECT_TRUE(contains(page.html, "<td>Jane Doe</td>"));
}

TEST(MarkdownFile, SlideDecksSkipFrontMatterTable) {
  test::TempDir dir;
  test::writeText(dir / "deck.md", "---\nmode: slides\nowner: Jane\n---\n# Deck\n");
  RenderedPage page = renderMarkdownFile(dir.path(), "deck.md", {});
  EXPECT_EQ(page.mode, DocMode::Slides);
  EXPECT_TRUE(contains(page.html, "data-slide-count=\"1\""));
  EXPECT_FALSE(contains(page.html, "front-matter-table"));
}

TEST(MarkdownFile, RewritesLinksAndCollectsWarnings) {
  test::TempDir dir;
  test::writeText(dir / "docs/README.md", "# Readme");
  test::writeText(dir / "docs/guide/intro.md", "# Intro");
  test::writeText(dir / "docs/index.md",
                  "# Docs\n\n[Doc](guide/intro.md) [Root](README.md) "
                  "[Gone](missing.md)\n");

  DirSet indexDirs{"docs"};
  RenderedPage page = renderMarkdownFile(dir.path(), "docs/index.md", indexDirs);
  EXPECT_TRUE(contains(page.html, "href=\"guide/intro.html\""));
  EXPECT_TRUE(contains(page.html, "href=\"README.html\""));
  EXPECT_TRUE(contains(page.html, "href=\"missing.html\""));
  ASSERT_EQ(page.warnings.size(), 1u);
  EXPECT_TRUE(contains(page.warnings[0], "missing.md"));
}

TEST(MarkdownFile, ReportsUnreadableFile) {
  test::TempDir dir;
  EXPECT_THROW(renderMarkdownFile(dir.path(), "absent.md", {}),
               std::runtime_error);
}
