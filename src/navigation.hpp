/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file navigation.hpp
 * @brief Sidebar navigation and breadcrumbs derived from the directory tree.
 *
 * All links are relative to the directory of the page they are shown on.
 */

#ifndef RENDAR_NAVIGATION_HPP
#define RENDAR_NAVIGATION_HPP

#include "site_map.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rendar {

namespace fs = std::filesystem;

struct NavLink {
  std::string label;
  std::string href;
};

/**
 * @brief What the sidebar of one page shows.
 */
struct Navigation {
  std::vector<NavLink> pages;   ///< Siblings in title order.
  std::vector<NavLink> folders; ///< Child landing folders in label order.
};

struct Breadcrumb {
  std::string label;
  std::optional<std::string> href; ///< Unset for the current page.
};

/**
 * @brief Relative URL from directory @p fromDir to @p to, both relative to
 * the same root.
 *
 * One `..` per segment of @p fromDir below the common prefix, then the rest
 * of @p to. Identical paths give `.`.
 */
std::string relativeLink(const fs::path &fromDir, const fs::path &to);

/**
 * @brief Sibling pages (without @p page itself) and child folders that have
 * a landing page.
 */
Navigation buildNavigation(const PageEntry &page, const SiteMap &map);

/**
 * @brief Root-to-page trail over landing directories, ending with an
 * unlinked crumb for @p page.
 *
 * The root is labelled "Home". The page's own directory is left out when
 * @p page is that directory's landing page.
 */
std::vector<Breadcrumb> buildBreadcrumbs(const PageEntry &page,
                                         const SiteMap &map);

/// `<ul class="nav-list">` fragment.
std::string navigationHtml(const Navigation &nav);

/// `<nav class="breadcrumbs">` fragment.
std::string breadcrumbsHtml(const std::vector<Breadcrumb> &crumbs);

} // namespace rendar

#endif // RENDAR_NAVIGATION_HPP
