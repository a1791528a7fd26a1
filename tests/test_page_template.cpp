/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "page_template.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace rendar;

TEST(PageTemplate, BuiltInLayoutPlacesEveryFragment) {
  PageTemplate page = PageTemplate::builtIn();
  EXPECT_TRUE(page.missingPlaceholders().empty());

  std::string html = page.render("My Title", "<p>Body</p>", "<ul>nav</ul>",
                                 "<nav>crumbs</nav>", "<meta name=\"x\">",
                                 "<script>tail()</script>");
  EXPECT_TRUE(html.starts_with("<!DOCTYPE html>"));
  EXPECT_NE(html.find("<title>My Title</title>"), std::string::npos);
  EXPECT_NE(html.find("<p>Body</p>"), std::string::npos);
  EXPECT_NE(html.find("<ul>nav</ul>"), std::string::npos);
  EXPECT_NE(html.find("<nav>crumbs</nav>"), std::string::npos);
  EXPECT_NE(html.find("<meta name=\"x\">"), std::string::npos);
  EXPECT_NE(html.find("<script>tail()</script>"), std::string::npos);
  EXPECT_NE(html.find(".nav-list"), std::string::npos);
  EXPECT_LT(html.find("<nav>crumbs</nav>"), html.find("<p>Body</p>"));
}

TEST(PageTemplate, CustomLayoutGetsNoStylesheet) {
  PageTemplate page("<h1>{{ title }}</h1>[{{ style }}]{{content}}", "");
  EXPECT_EQ(page.render("T", "C", "", "", "", ""), "<h1>T</h1>[]C");
}

TEST(PageTemplate, ReportsMissingPlaceholders) {
  PageTemplate page("{{ title }} {{content}}", "");
  std::vector<std::string> expected{"nav", "breadcrumbs", "extra_head",
                                    "extra_body"};
  EXPECT_EQ(page.missingPlaceholders(), expected);
}

TEST(PageTemplate, CopiesRenderIndependently) {
  PageTemplate original("<b>{{ title }}</b>", "");
  PageTemplate copy(original);
  EXPECT_EQ(copy.source(), original.source());
  EXPECT_EQ(copy.render("x", "", "", "", "", ""), "<b>x</b>");
}

TEST(PageTemplate, LoadsFromFile) {
  test::TempDir dir;
  test::writeText(dir / "theme.html", "<main>{{ content }}</main>");
  PageTemplate page = PageTemplate::fromPath(dir / "theme.html");
  EXPECT_EQ(page.render("", "hello", "", "", "", ""), "<main>hello</main>");
}

TEST(PageTemplate, ReportsLoadErrors) {
  test::TempDir dir;
  EXPECT_THROW(PageTemplate::fromPath(dir / "absent.html"), std::runtime_error);

  test::writeText(dir / "broken.html", "{% if title %}unterminated");
  EXPECT_THROW(PageTemplate::fromPath(dir / "broken.html"), std::runtime_error);
}
