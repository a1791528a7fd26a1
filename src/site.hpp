/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file site.hpp
 * @brief Build pipeline: turns an input tree into the output site.
 *
 * Directories are mirrored, assets copied byte for byte and content files
 * rendered through the page template. A README in a directory without an
 * index page is written twice, as `README.html` and as `index.html`.
 */

#ifndef RENDAR_SITE_HPP
#define RENDAR_SITE_HPP

#include "csv_preview.hpp"
#include "exclude.hpp"
#include "page_template.hpp"
#include "path_classifier.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rendar {

namespace fs = std::filesystem;

struct RenderOptions {
  bool liveReload = false; ///< Inject the version polling script.
  bool heartbeat = false;  ///< Also post heartbeats (auto-exit).
  const ExcludeSet *excludes = nullptr;
  std::optional<std::size_t> csvMaxRows = kDefaultCsvMaxRows; ///< Unset: all.
};

/**
 * @brief Outcome of one build.
 */
struct BuildReport {
  std::size_t pages = 0;  ///< Content pages rendered.
  std::size_t assets = 0; ///< Files copied.
  std::vector<std::string> warnings;
};

/**
 * @brief Renders @p input into @p output.
 *
 * Warnings are printed to stderr as they occur and also returned.
 *
 * @throws std::runtime_error or std::filesystem::filesystem_error on I/O
 * failures.
 */
BuildReport buildSite(const fs::path &input, const fs::path &output,
                      const PageTemplate &pageTemplate,
                      const RenderOptions &options);

/**
 * @brief Renders every page without writing anything.
 * @return Number of warnings, each also printed to stderr.
 */
std::size_t checkSite(const fs::path &input, const ExcludeSet *excludes);

/**
 * @brief URL path of a page inside the output site. A README without an
 * index sibling maps to its directory's `index.html`.
 */
fs::path outputRelPath(const fs::path &sourceRel, const DirSet &indexDirs);

/// Generic path as a `/`-separated URL path without `.` segments.
std::string pathToUrl(const fs::path &path);

/**
 * @brief Script reloading the page when the preview version changes.
 * @param heartbeat Also report page activity to the server.
 */
std::string liveReloadScript(bool heartbeat);

} // namespace rendar

#endif // RENDAR_SITE_HPP
