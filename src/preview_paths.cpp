/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "preview_paths.hpp"

#include "path_classifier.hpp"

#include <format>
#include <stdexcept>
#include <system_error>

namespace rendar {

namespace {

constexpr const char *kLandingNames[] = {"index.md", "index.markdown",
                                         "README.md", "README.markdown"};

fs::path fromCwd(const fs::path &cwd, const fs::path &path) {
  return path.is_absolute() ? path : cwd / path;
}

} // namespace

std::optional<fs::path> findLandingPage(const fs::path &dir) {
  for (const char *name : kLandingNames) {
    fs::path candidate = dir / name;
    std::error_code ec;
    if (fs::exists(candidate, ec))
      return candidate;
  }
  return std::nullopt;
}

fs::path resolveStartPage(const fs::path &startOn) {
  std::error_code ec;
  if (fs::is_directory(startOn, ec)) {
    if (auto landing = findLandingPage(startOn))
      return *landing;
    throw std::runtime_error(
        std::format("No index.md or README.md found in directory {}",
                    startOn.string()));
  }

  if (!fs::exists(startOn, ec))
    throw std::runtime_error(
        std::format("Start page {} does not exist", startOn.string()));
  if (!isContentFile(startOn))
    throw std::runtime_error(std::format(
        "Start page {} is not a Markdown or CSV file", startOn.string()));
  return startOn;
}

fs::path discoverRootForStart(const fs::path &startPage) {
  fs::path first = startPage.has_parent_path() ? startPage.parent_path()
                                               : startPage;
  fs::path current = first;
  std::optional<fs::path> lastWithLanding;

  while (true) {
    if (findLandingPage(current))
      lastWithLanding = current;
    else if (lastWithLanding)
      break;

    if (!current.has_parent_path() || current.parent_path() == current)
      break;
    current = current.parent_path();
  }

  return lastWithLanding.value_or(first);
}

PreviewPaths resolvePreviewPaths(const fs::path &cwd,
                                 const std::optional<fs::path> &inputOverride,
                                 const std::optional<fs::path> &startOn) {
  PreviewPaths paths;
  if (startOn)
    paths.startPage = resolveStartPage(fromCwd(cwd, *startOn));

  if (inputOverride)
    paths.inputRoot = fromCwd(cwd, *inputOverride);
  else if (paths.startPage && !isInside(*paths.startPage, cwd))
    paths.inputRoot = discoverRootForStart(*paths.startPage);
  else
    paths.inputRoot = cwd;

  if (paths.startPage && !isInside(*paths.startPage, paths.inputRoot))
    throw std::runtime_error(
        std::format("Start page {} is not under input root {}",
                    paths.startPage->string(), paths.inputRoot.string()));
  return paths;
}

} // namespace rendar
