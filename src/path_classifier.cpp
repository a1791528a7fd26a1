/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "path_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace rendar {

namespace {

std::string extensionOf(const fs::path &path) {
  std::string ext = path.extension().string();
  if (!ext.empty() && ext.front() == '.')
    ext.erase(0, 1);
  return toLower(ext);
}

fs::path canonicalOrLiteral(const fs::path &path) {
  std::error_code ec;
  fs::path resolved = fs::canonical(path, ec);
  if (ec)
    return path;
  return resolved;
}

} // namespace

std::string toLower(std::string_view text) {
  std::string lowered(text);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

fs::path normalizeRelDir(const fs::path &dir) {
  fs::path normal = dir.lexically_normal();
  if (normal == ".")
    return {};
  if (!normal.empty() && !normal.has_filename())
    normal = normal.parent_path();
  return normal;
}

bool isMarkdownFile(const fs::path &path) {
  std::string ext = extensionOf(path);
  return ext == "md" || ext == "markdown";
}

bool isCsvFile(const fs::path &path) { return extensionOf(path) == "csv"; }

bool isContentFile(const fs::path &path) {
  return isMarkdownFile(path) || isCsvFile(path);
}

bool isReadme(const fs::path &path) {
  return isContentFile(path) && toLower(path.stem().string()) == "readme";
}

bool isIndex(const fs::path &path) {
  return isContentFile(path) && toLower(path.stem().string()) == "index";
}

bool isInside(const fs::path &path, const fs::path &root) {
  fs::path p = canonicalOrLiteral(path);
  fs::path r = canonicalOrLiteral(root);

  auto pIt = p.begin();
  for (auto rIt = r.begin(); rIt != r.end(); ++rIt) {
    // A trailing separator shows up as an empty element.
    if (rIt->empty())
      continue;
    if (pIt == p.end() || *pIt != *rIt)
      return false;
    ++pIt;
  }
  return true;
}

std::string humanizeName(std::string_view name) {
  std::string label(name);
  std::ranges::replace(label, '-', ' ');
  std::ranges::replace(label, '_', ' ');
  return label;
}

} // namespace rendar
