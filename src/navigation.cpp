/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "navigation.hpp"

#include "file_io.hpp"

#include <algorithm>
#include <format>

namespace rendar {

namespace {

/// Normal and `..` segments; `.` and empty elements are dropped.
std::vector<std::string> segments(const fs::path &path) {
  std::vector<std::string> parts;
  for (const auto &part : path.lexically_normal()) {
    std::string s = part.string();
    if (s.empty() || s == "." || s == "/")
      continue;
    parts.push_back(std::move(s));
  }
  return parts;
}

} // namespace

std::string relativeLink(const fs::path &fromDir, const fs::path &to) {
  std::vector<std::string> from = segments(fromDir);
  std::vector<std::string> target = segments(to);

  std::size_t common = 0;
  while (common < from.size() && common < target.size() &&
         from[common] == target[common])
    ++common;

  std::string link;
  auto append = [&link](std::string_view part) {
    if (!link.empty())
      link += '/';
    link += part;
  };
  for (std::size_t i = common; i < from.size(); ++i)
    append("..");
  for (std::size_t i = common; i < target.size(); ++i)
    append(target[i]);

  return link.empty() ? "." : link;
}

Navigation buildNavigation(const PageEntry &page, const SiteMap &map) {
  Navigation nav;
  fs::path dir = page.dir();

  if (auto it = map.pagesByDir.find(dir); it != map.pagesByDir.end()) {
    for (const auto &sibling : it->second) {
      if (sibling.sourcePath == page.sourcePath)
        continue;
      nav.pages.push_back(
          {sibling.title, relativeLink(dir, sibling.outputPath)});
    }
  }

  for (const auto &landing : map.landingDirs) {
    if (landing.empty() || landing == dir)
      continue;
    if (normalizeRelDir(landing.parent_path()) != dir)
      continue;
    nav.folders.push_back(
        {map.folderLabel(landing), relativeLink(dir, landing / "index.html")});
  }
  std::ranges::stable_sort(nav.folders, {}, &NavLink::label);

  return nav;
}

std::vector<Breadcrumb> buildBreadcrumbs(const PageEntry &page,
                                         const SiteMap &map) {
  std::vector<Breadcrumb> crumbs;
  fs::path dir = page.dir();
  bool selfIsLanding = map.isLandingPage(page);

  std::vector<fs::path> chain{fs::path()};
  fs::path walked;
  for (const auto &part : dir) {
    walked /= part;
    chain.push_back(walked);
  }

  for (const auto &ancestor : chain) {
    if (!map.landingDirs.contains(ancestor))
      continue;
    if (ancestor == dir && selfIsLanding)
      continue;
    std::string label = ancestor.empty() ? "Home" : map.folderLabel(ancestor);
    crumbs.push_back({label, relativeLink(dir, ancestor / "index.html")});
  }

  crumbs.push_back({page.title, std::nullopt});
  return crumbs;
}

std::string navigationHtml(const Navigation &nav) {
  std::string html = "<ul class=\"nav-list\">\n";
  for (const auto &link : nav.pages)
    html += std::format("  <li class=\"nav-page\"><a href=\"{}\">{}</a></li>\n",
                        escapeHtml(link.href), escapeHtml(link.label));
  for (const auto &link : nav.folders)
    html += std::format(
        "  <li class=\"nav-folder\"><a href=\"{}\">{}</a></li>\n",
        escapeHtml(link.href), escapeHtml(link.label));
  html += "</ul>\n";
  return html;
}

std::string breadcrumbsHtml(const std::vector<Breadcrumb> &crumbs) {
  std::string html = "<nav class=\"breadcrumbs\" aria-label=\"Breadcrumb\"><ol>";
  for (const auto &crumb : crumbs) {
    if (crumb.href)
      html += std::format("<li><a href=\"{}\">{}</a></li>",
                          escapeHtml(*crumb.href), escapeHtml(crumb.label));
    else
      html += std::format("<li aria-current=\"page\">{}</li>",
                          escapeHtml(crumb.label));
  }
  html += "</ol></nav>\n";
  return html;
}

} // namespace rendar
