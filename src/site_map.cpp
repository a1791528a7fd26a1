/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "site_map.hpp"

#include "file_io.hpp"
#include "markdown.hpp"

#include <algorithm>

namespace rendar {

namespace {

std::string pageTitle(const fs::path &inputRoot, const fs::path &sourceRel) {
  if (isMarkdownFile(sourceRel)) {
    if (auto heading = firstHeadingTitle(readFile(inputRoot / sourceRel)))
      return *heading;
  }
  return humanizeName(sourceRel.stem().string());
}

} // namespace

const PageEntry *SiteMap::find(const fs::path &sourceRel) const {
  auto it = pagesByPath.find(sourceRel.lexically_normal());
  return it == pagesByPath.end() ? nullptr : &it->second;
}

const PageEntry *SiteMap::landingPage(const fs::path &dir) const {
  auto it = pagesByDir.find(normalizeRelDir(dir));
  if (it == pagesByDir.end())
    return nullptr;

  const PageEntry *readme = nullptr;
  for (const auto &page : it->second) {
    if (page.isIndex)
      return &page;
    if (page.isReadme && readme == nullptr)
      readme = &page;
  }
  return readme;
}

bool SiteMap::isLandingPage(const PageEntry &page) const {
  const PageEntry *landing = landingPage(page.dir());
  return landing != nullptr && landing->sourcePath == page.sourcePath;
}

std::string SiteMap::folderLabel(const fs::path &dir) const {
  if (const PageEntry *landing = landingPage(dir))
    return landing->title;
  return humanizeName(normalizeRelDir(dir).filename().string());
}

fs::path pageOutputPath(const fs::path &sourceRel) {
  if (isIndex(sourceRel))
    return sourceRel.parent_path() / "index.html";
  fs::path out = sourceRel;
  out.replace_extension(".html");
  return out;
}

SiteMap buildSiteMap(const fs::path &inputRoot, const ExcludeSet *excludes,
                     const fs::path &outputRoot) {
  SiteMap map;

  fs::recursive_directory_iterator it(inputRoot);
  for (auto end = fs::recursive_directory_iterator(); it != end; ++it) {
    const fs::path &path = it->path();
    bool isDir = it->is_directory();

    if ((!outputRoot.empty() && isDir && isInside(path, outputRoot)) ||
        isExcludedPath(path, inputRoot, excludes)) {
      if (isDir)
        it.disable_recursion_pending();
      continue;
    }
    if (isDir || !it->is_regular_file() || !isContentFile(path))
      continue;

    PageEntry page;
    page.sourcePath = path.lexically_relative(inputRoot).lexically_normal();
    page.outputPath = pageOutputPath(page.sourcePath);
    page.title = pageTitle(inputRoot, page.sourcePath);
    page.isIndex = isIndex(path);
    page.isReadme = isReadme(path);

    fs::path dir = page.dir();
    if (page.isIndex)
      map.indexDirs.insert(dir);
    if (page.isIndex || page.isReadme)
      map.landingDirs.insert(dir);

    map.pagesByPath[page.sourcePath] = page;
    map.pagesByDir[dir].push_back(std::move(page));
  }

  for (auto &[dir, pages] : map.pagesByDir) {
    std::ranges::sort(pages, [](const PageEntry &a, const PageEntry &b) {
      if (a.title != b.title)
        return a.title < b.title;
      return a.sourcePath < b.sourcePath;
    });
  }

  return map;
}

} // namespace rendar
