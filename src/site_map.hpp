/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file site_map.hpp
 * @brief Registry of all content pages of one build pass.
 */

#ifndef RENDAR_SITE_MAP_HPP
#define RENDAR_SITE_MAP_HPP

#include "exclude.hpp"
#include "path_classifier.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace rendar {

namespace fs = std::filesystem;

/**
 * @brief One content file.
 */
struct PageEntry {
  fs::path sourcePath; ///< Relative to the input root.
  fs::path outputPath; ///< Relative to the output root, `.html`.
  std::string title;   ///< First heading, or the humanized file name.
  bool isIndex = false;
  bool isReadme = false;

  /// Input-relative directory holding the page ("" for the root).
  fs::path dir() const { return normalizeRelDir(sourcePath.parent_path()); }
};

/**
 * @brief Pages grouped by directory plus the directory classifications.
 *
 * Every page appears once in its directory group and once in the path
 * lookup. indexDirs is a subset of landingDirs.
 */
struct SiteMap {
  std::map<fs::path, std::vector<PageEntry>> pagesByDir; ///< Title order.
  std::map<fs::path, PageEntry> pagesByPath;
  DirSet indexDirs;   ///< Directories with an index page.
  DirSet landingDirs; ///< Directories with an index or README page.

  /// Page for an input-relative source path, or nullptr.
  const PageEntry *find(const fs::path &sourceRel) const;

  /**
   * @brief The page a directory opens with: its index page, else its
   * README. nullptr when the directory has neither.
   */
  const PageEntry *landingPage(const fs::path &dir) const;

  /// True if @p page is the landing page of its own directory.
  bool isLandingPage(const PageEntry &page) const;

  /// Landing page title, or the humanized directory name.
  std::string folderLabel(const fs::path &dir) const;
};

/**
 * @brief Output path of a content file: `index.html` for index pages,
 * otherwise the stem with `.html`.
 */
fs::path pageOutputPath(const fs::path &sourceRel);

/**
 * @brief Walks @p inputRoot once and registers every content file.
 * @param excludes Patterns to skip, or nullptr.
 * @param outputRoot Directory never descended into; may be empty.
 * @throws std::filesystem::filesystem_error on traversal failures.
 * @throws std::runtime_error if a page cannot be read.
 */
SiteMap buildSiteMap(const fs::path &inputRoot, const ExcludeSet *excludes,
                     const fs::path &outputRoot = {});

} // namespace rendar

#endif // RENDAR_SITE_MAP_HPP
