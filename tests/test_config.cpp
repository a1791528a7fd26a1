/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "config.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace rendar;

namespace {

/// Message of the ConfigError thrown by parsing @p text, or "".
std::string parseError(std::string_view text) {
  try {
    parseConfig(text, "rendar.toml");
  } catch (const ConfigError &e) {
    return e.what();
  }
  return {};
}

} // namespace

TEST(Config, LoadsAndResolvesPaths) {
  test::TempDir dir;
  test::writeText(dir / "rendar.toml", R"(
input = "docs"
template = "theme.html"
exclude = ["AGENTS.md", "CLAUDE.md"]

[preview]
port = 4040
open = true
)");

  auto config = loadConfig(dir / "rendar.toml");
  ASSERT_TRUE(config);
  EXPECT_EQ(config->input, dir / "docs");
  EXPECT_EQ(config->templatePath, dir / "theme.html");
  ASSERT_TRUE(config->exclude);
  EXPECT_EQ(*config->exclude,
            (std::vector<std::string>{"AGENTS.md", "CLAUDE.md"}));
  EXPECT_EQ(config->preview.port, 4040);
  EXPECT_EQ(config->preview.open, true);
  EXPECT_FALSE(config->csvMaxRows);
}

TEST(Config, KeepsAbsolutePaths) {
  test::TempDir dir;
  test::writeText(dir / "rendar.toml", "input = \"/srv/docs\"\n");
  auto config = loadConfig(dir / "rendar.toml");
  ASSERT_TRUE(config);
  EXPECT_EQ(config->input, fs::path("/srv/docs"));
  EXPECT_FALSE(config->templatePath);
}

TEST(Config, DiscoversFileInWorkingDirectory) {
  test::TempDir dir;
  EXPECT_FALSE(loadConfig(std::nullopt, dir.path()));

  test::writeText(dir / "rendar.toml", "csv_max_rows = 0\n");
  auto config = loadConfig(std::nullopt, dir.path());
  ASSERT_TRUE(config);
  EXPECT_EQ(config->csvMaxRows, 0u);
}

TEST(Config, RelativeExplicitPathUsesWorkingDirectory) {
  test::TempDir dir;
  test::writeText(dir / "conf/site.toml", "input = \"pages\"\n");
  auto config = loadConfig(fs::path("conf/site.toml"), dir.path());
  ASSERT_TRUE(config);
  EXPECT_EQ(config->input, dir / "conf/pages");
}

TEST(Config, MissingExplicitFileIsAnError) {
  test::TempDir dir;
  EXPECT_THROW(loadConfig(dir / "absent.toml"), std::runtime_error);
}

TEST(Config, AcceptsCommentsAndLiteralStrings) {
  Config config = parseConfig(R"(# site settings
input = 'C:\docs'   # literal
exclude = [
  "a.md",  # first
  "b/**",
]
unknown = 1

[other]
port = "ignored"

[preview]
port = 8_080
)",
                              "rendar.toml");
  EXPECT_EQ(config.input, fs::path("C:\\docs"));
  EXPECT_EQ(*config.exclude, (std::vector<std::string>{"a.md", "b/**"}));
  EXPECT_EQ(config.preview.port, 8080);
}

TEST(Config, ReportsTypeErrorsWithLine) {
  EXPECT_EQ(parseError("[preview]\nport = 70000\n"),
            "rendar.toml:2: 'port' must be a port number between 1 and 65535");
  EXPECT_EQ(parseError("input = 3\n"), "rendar.toml:1: 'input' must be a string");
  EXPECT_EQ(parseError("exclude = [\"a\", 1]\n"),
            "rendar.toml:1: 'exclude' must be an array of strings");
  EXPECT_EQ(parseError("\n[preview]\nopen = \"yes\"\n"),
            "rendar.toml:3: 'open' must be a boolean");
  EXPECT_EQ(parseError("csv_max_rows = -1\n"),
            "rendar.toml:1: 'csv_max_rows' must be a non-negative integer");
}

TEST(Config, ReportsSyntaxErrors) {
  EXPECT_EQ(parseError("input = \"docs\"\ninput = \"other\"\n"),
            "rendar.toml:2: duplicate key 'input'");
  EXPECT_EQ(parseError("[preview]\n[preview]\n"),
            "rendar.toml:2: duplicate table [preview]");
  EXPECT_EQ(parseError("input = \"docs\n"), "rendar.toml:1: unterminated string");
  EXPECT_EQ(parseError("input \"docs\"\n"), "rendar.toml:1: expected '='");
  EXPECT_EQ(parseError("input = \"a\" b\n"),
            "rendar.toml:1: unexpected text after value");
}
