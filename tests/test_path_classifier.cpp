/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "path_classifier.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace rendar;

TEST(PathClassifier, RecognizesContentExtensionsCaseInsensitively) {
  EXPECT_TRUE(isMarkdownFile("guide/intro.md"));
  EXPECT_TRUE(isMarkdownFile("NOTES.MARKDOWN"));
  EXPECT_FALSE(isMarkdownFile("readme.txt"));
  EXPECT_TRUE(isCsvFile("data/People.CSV"));
  EXPECT_TRUE(isContentFile("a.csv"));
  EXPECT_FALSE(isContentFile("logo.png"));
  EXPECT_FALSE(isContentFile("md"));
}

TEST(PathClassifier, DetectsLandingPageNames) {
  EXPECT_TRUE(isIndex("docs/index.md"));
  EXPECT_TRUE(isIndex("docs/INDEX.markdown"));
  EXPECT_TRUE(isIndex("index.csv"));
  EXPECT_FALSE(isIndex("index.html"));
  EXPECT_TRUE(isReadme("README.md"));
  EXPECT_TRUE(isReadme("sub/Readme.Md"));
  EXPECT_FALSE(isReadme("README"));
  EXPECT_FALSE(isReadme("readme-old.md"));
}

TEST(PathClassifier, NormalizesRelativeDirectories) {
  EXPECT_EQ(normalizeRelDir("."), fs::path());
  EXPECT_EQ(normalizeRelDir(""), fs::path());
  EXPECT_EQ(normalizeRelDir("docs/./guide/"), fs::path("docs/guide"));
  EXPECT_EQ(normalizeRelDir("docs/guide/.."), fs::path("docs"));
}

TEST(PathClassifier, HumanizesSeparators) {
  EXPECT_EQ(humanizeName("getting-started_guide"), "getting started guide");
  EXPECT_EQ(humanizeName("plain"), "plain");
}

TEST(PathClassifier, ChecksContainment) {
  test::TempDir dir;
  fs::create_directories(dir / "docs/sub");
  EXPECT_TRUE(isInside(dir / "docs/sub", dir / "docs"));
  EXPECT_TRUE(isInside(dir / "docs", dir / "docs"));
  EXPECT_TRUE(isInside(dir / "docs/sub/../sub", dir.path()));
  EXPECT_FALSE(isInside(dir / "docs", dir / "docs/sub"));
  EXPECT_FALSE(isInside(dir / "docsy", dir / "docs"));
}
