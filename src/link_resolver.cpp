/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "link_resolver.hpp"

#include <format>
#include <system_error>
#include <vector>

namespace rendar {

namespace {

/**
 * @brief The part of @p dest before its file name, with a trailing `/`.
 *
 * Absolute destinations always keep their leading `/`, and no `//` is ever
 * produced.
 */
std::string parentPrefix(std::string_view dest) {
  bool absolute = dest.starts_with('/');
  std::size_t slash = dest.rfind('/');
  if (slash == std::string_view::npos)
    return {};

  std::string_view parent = dest.substr(0, slash);
  std::string prefix;
  if (absolute) {
    prefix += '/';
    while (parent.starts_with('/'))
      parent.remove_prefix(1);
    if (!parent.empty()) {
      prefix += parent;
      prefix += '/';
    }
  } else if (!parent.empty() && parent != ".") {
    prefix += parent;
    prefix += '/';
  }
  return prefix;
}

std::string_view fileNameOf(std::string_view dest) {
  std::size_t slash = dest.rfind('/');
  return slash == std::string_view::npos ? dest : dest.substr(slash + 1);
}

/**
 * @brief Locates the link target on disk.
 * @return (file on disk, input-relative directory of the target). The
 * directory is std::nullopt when the target lies outside the input root.
 */
std::pair<fs::path, std::optional<fs::path>>
resolveLinkPath(const std::string &normalized, const LinkContext &context) {
  if (normalized.starts_with('/')) {
    fs::path rel(normalized.substr(1));
    return {context.inputRoot / rel, normalizeRelDir(rel.parent_path())};
  }

  fs::path sourceDir = context.sourceRel.parent_path();
  fs::path target = (sourceDir / normalized).lexically_normal();
  std::optional<fs::path> relDir;
  if (target.empty() || *target.begin() != "..")
    relDir = normalizeRelDir(target.parent_path());
  return {context.inputRoot / sourceDir / normalized, relDir};
}

} // namespace

std::optional<std::pair<std::string, std::string>>
splitLink(std::string_view dest) {
  if (dest.empty())
    return std::nullopt;
  std::size_t cut = dest.find_first_of("#?");
  if (cut == std::string_view::npos)
    return std::make_pair(std::string(dest), std::string());
  return std::make_pair(std::string(dest.substr(0, cut)),
                        std::string(dest.substr(cut)));
}

std::string normalizeLinkPath(std::string_view path) {
  bool absolute = path.starts_with('/');
  std::vector<std::string_view> parts;

  std::size_t start = 0;
  while (start <= path.size()) {
    std::size_t end = path.find('/', start);
    if (end == std::string_view::npos)
      end = path.size();
    std::string_view segment = path.substr(start, end - start);
    start = end + 1;

    if (segment.empty() || segment == ".")
      continue;
    if (segment == "..") {
      if (!parts.empty() && parts.back() != "..")
        parts.pop_back();
      else if (!absolute)
        parts.push_back(segment);
      continue;
    }
    parts.push_back(segment);
  }

  std::string joined;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      joined += '/';
    joined += parts[i];
  }

  if (absolute)
    return "/" + joined;
  return joined.empty() ? std::string(".") : joined;
}

bool hasScheme(std::string_view dest) {
  return dest.starts_with("http://") || dest.starts_with("https://");
}

std::string replaceMarkdownExtension(std::string_view dest) {
  std::string result = parentPrefix(dest);
  result += fs::path(fileNameOf(dest)).stem().string();
  result += ".html";
  return result;
}

std::string directoryIndex(std::string_view dest) {
  return parentPrefix(dest) + "index.html";
}

RewrittenLink rewriteLinkDestination(std::string_view dest,
                                     const LinkContext &context) {
  auto split = splitLink(dest);
  if (!split)
    return {std::string(dest), std::nullopt};

  const auto &[base, suffix] = *split;
  if (base.empty() || base.starts_with('#') || hasScheme(base) ||
      base.starts_with("mailto:") || base.starts_with("tel:"))
    return {std::string(dest), std::nullopt};

  std::string normalized = normalizeLinkPath(base);
  if (!isContentFile(fs::path(std::string(fileNameOf(normalized)))))
    return {std::string(dest), std::nullopt};

  auto [resolved, relDir] = resolveLinkPath(normalized, context);

  RewrittenLink link;
  std::error_code ec;
  if (!fs::exists(resolved, ec))
    link.warning = std::format("Missing link target: {} referenced from {}",
                               normalized,
                               (context.inputRoot / context.sourceRel).string());

  fs::path target(std::string(fileNameOf(normalized)));
  if (isIndex(target)) {
    link.destination = directoryIndex(normalized);
  } else if (isReadme(target)) {
    bool shadowed = relDir && context.indexDirs.contains(*relDir);
    link.destination = shadowed ? replaceMarkdownExtension(normalized)
                                : directoryIndex(normalized);
  } else {
    link.destination = replaceMarkdownExtension(normalized);
  }
  link.destination += suffix;
  return link;
}

} // namespace rendar
