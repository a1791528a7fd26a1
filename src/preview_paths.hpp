/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file preview_paths.hpp
 * @brief Works out the input root and the start page of a preview session.
 */

#ifndef RENDAR_PREVIEW_PATHS_HPP
#define RENDAR_PREVIEW_PATHS_HPP

#include <filesystem>
#include <optional>

namespace rendar {

namespace fs = std::filesystem;

struct PreviewPaths {
  fs::path inputRoot;
  std::optional<fs::path> startPage; ///< Absolute when set.
};

/**
 * @brief First of `index.md`, `index.markdown`, `README.md` and
 * `README.markdown` that exists in @p dir.
 */
std::optional<fs::path> findLandingPage(const fs::path &dir);

/**
 * @brief Turns a `--start-on` argument into a page.
 *
 * A directory resolves to its landing page. A file must exist and be a
 * content file.
 *
 * @throws std::runtime_error if no page can be derived.
 */
fs::path resolveStartPage(const fs::path &startOn);

/**
 * @brief Guesses the site root for a start page.
 *
 * Walks up from the page's directory. The result is the topmost directory
 * of the first run of directories that have a landing page; without any
 * such directory it is the page's own directory.
 */
fs::path discoverRootForStart(const fs::path &startPage);

/**
 * @brief Resolves input root and start page relative to @p cwd.
 *
 * An explicit @p inputOverride wins. Otherwise the root is @p cwd when the
 * start page lies inside it, else discoverRootForStart().
 *
 * @throws std::runtime_error if the start page is not under the input root.
 */
PreviewPaths resolvePreviewPaths(const fs::path &cwd,
                                 const std::optional<fs::path> &inputOverride,
                                 const std::optional<fs::path> &startOn);

} // namespace rendar

#endif // RENDAR_PREVIEW_PATHS_HPP
