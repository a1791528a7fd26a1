/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file exclude.hpp
 * @brief Glob patterns that keep files out of the rendered site.
 *
 * Patterns are matched against the input-relative path in generic form
 * (`docs/draft.md`). Supported syntax: `*` (any run of characters, `/`
 * included), `?` (one character), `[abc]`, `[a-z]`, `[!abc]`, and `**`
 * followed by a slash, which may also match no directory at all.
 */

#ifndef RENDAR_EXCLUDE_HPP
#define RENDAR_EXCLUDE_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace rendar {

namespace fs = std::filesystem;

/**
 * @brief Matches a single glob pattern against a generic path string.
 */
bool globMatch(std::string_view pattern, std::string_view text);

class ExcludeSet {
public:
  ExcludeSet() = default;

  /**
   * @brief Validates and stores the patterns.
   * @throws std::invalid_argument for a malformed pattern (unclosed `[`).
   */
  explicit ExcludeSet(std::vector<std::string> patterns);

  bool empty() const { return patterns_.empty(); }
  const std::vector<std::string> &patterns() const { return patterns_; }

  /**
   * @brief True if any pattern matches @p relativePath.
   */
  bool matches(const fs::path &relativePath) const;

private:
  std::vector<std::string> patterns_;
};

/**
 * @brief Checks @p path (absolute or relative to the cwd) against the
 * exclude set, after making it relative to @p inputRoot. Every ancestor
 * directory is tested too, so an excluded directory excludes its content.
 */
bool isExcludedPath(const fs::path &path, const fs::path &inputRoot,
                    const ExcludeSet *excludes);

} // namespace rendar

#endif // RENDAR_EXCLUDE_HPP
