/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "navigation.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace rendar;

TEST(RelativeLink, WalksBetweenDirectories) {
  EXPECT_EQ(relativeLink("", "index.html"), "index.html");
  EXPECT_EQ(relativeLink("docs", "docs/intro.html"), "intro.html");
  EXPECT_EQ(relativeLink("docs/guide", "index.html"), "../../index.html");
  EXPECT_EQ(relativeLink("docs/guide", "docs/api/index.html"),
            "../api/index.html");
  EXPECT_EQ(relativeLink("docs", "docs"), ".");
}

class NavigationTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::writeText(dir_ / "README.md", "# Project\n");
    test::writeText(dir_ / "setup.md", "# Setup\n");
    test::writeText(dir_ / "zoo/index.md", "# Animals\n");
    test::writeText(dir_ / "zoo/lion.md", "# Lion\n");
    test::writeText(dir_ / "zoo/cats/README.md", "# Big Cats\n");
    test::writeText(dir_ / "apis/index.md", "# Reference\n");
    test::writeText(dir_ / "plain/page.md", "# Orphan\n");
    map_ = buildSiteMap(dir_.path(), nullptr);
  }

  const PageEntry &page(const fs::path &rel) const {
    const PageEntry *entry = map_.find(rel);
    EXPECT_NE(entry, nullptr) << rel;
    return *entry;
  }

  test::TempDir dir_;
  SiteMap map_;
};

TEST_F(NavigationTest, ListsSiblingsAndChildFolders) {
  Navigation nav = buildNavigation(page("README.md"), map_);
  ASSERT_EQ(nav.pages.size(), 1u);
  EXPECT_EQ(nav.pages[0].label, "Setup");
  EXPECT_EQ(nav.pages[0].href, "setup.html");

  // Folders without a landing page are not listed.
  ASSERT_EQ(nav.folders.size(), 2u);
  EXPECT_EQ(nav.folders[0].label, "Animals");
  EXPECT_EQ(nav.folders[0].href, "zoo/index.html");
  EXPECT_EQ(nav.folders[1].label, "Reference");
  EXPECT_EQ(nav.folders[1].href, "apis/index.html");
}

TEST_F(NavigationTest, NestedFolderLinksStayRelative) {
  Navigation nav = buildNavigation(page("zoo/lion.md"), map_);
  ASSERT_EQ(nav.pages.size(), 1u);
  EXPECT_EQ(nav.pages[0].href, "index.html");
  ASSERT_EQ(nav.folders.size(), 1u);
  EXPECT_EQ(nav.folders[0].label, "Big Cats");
  EXPECT_EQ(nav.folders[0].href, "cats/index.html");
}

TEST_F(NavigationTest, BreadcrumbsFollowLandingAncestors) {
  auto crumbs = buildBreadcrumbs(page("zoo/cats/README.md"), map_);
  ASSERT_EQ(crumbs.size(), 3u);
  EXPECT_EQ(crumbs[0].label, "Home");
  EXPECT_EQ(crumbs[0].href, "../../index.html");
  EXPECT_EQ(crumbs[1].label, "Animals");
  EXPECT_EQ(crumbs[1].href, "../index.html");
  EXPECT_EQ(crumbs[2].label, "Big Cats");
  EXPECT_FALSE(crumbs[2].href);
}

TEST_F(NavigationTest, BreadcrumbsIncludeOwnFolderForOrdinaryPages) {
  auto crumbs = buildBreadcrumbs(page("zoo/lion.md"), map_);
  ASSERT_EQ(crumbs.size(), 3u);
  EXPECT_EQ(crumbs[1].label, "Animals");
  EXPECT_EQ(crumbs[1].href, "index.html");
  EXPECT_EQ(crumbs[2].label, "Lion");
}

TEST_F(NavigationTest, BreadcrumbsSkipFoldersWithoutLanding) {
  auto crumbs = buildBreadcrumbs(page("plain/page.md"), map_);
  ASSERT_EQ(crumbs.size(), 2u);
  EXPECT_EQ(crumbs[0].href, "../index.html");
  EXPECT_EQ(crumbs[1].label, "Orphan");
}

TEST_F(NavigationTest, RootLandingPageHasSingleCrumb) {
  auto crumbs = buildBreadcrumbs(page("README.md"), map_);
  ASSERT_EQ(crumbs.size(), 1u);
  EXPECT_EQ(crumbs[0].label, "Project");
}

TEST(NavigationHtml, EscapesLabels) {
  Navigation nav;
  nav.pages.push_back({"A & B", "a.html"});
  nav.folders.push_back({"Dir", "dir/index.html"});
  EXPECT_EQ(navigationHtml(nav),
            "<ul class=\"nav-list\">\n"
            "  <li class=\"nav-page\"><a href=\"a.html\">A &amp; B</a></li>\n"
            "  <li class=\"nav-folder\"><a href=\"dir/index.html\">Dir</a></li>\n"
            "</ul>\n");
}

TEST(BreadcrumbsHtml, MarksCurrentPage) {
  std::vector<Breadcrumb> crumbs{{"Home", "../index.html"},
                                 {"Page <1>", std::nullopt}};
  EXPECT_EQ(breadcrumbsHtml(crumbs),
            "<nav class=\"breadcrumbs\" aria-label=\"Breadcrumb\"><ol>"
            "<li><a href=\"../index.html\">Home</a></li>"
            "<li aria-current=\"page\">Page &lt;1&gt;</li></ol></nav>\n");
}
