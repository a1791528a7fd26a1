/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file link_resolver.hpp
 * @brief Rewrites link destinations found in page content.
 *
 * Links to content files are turned into links to the generated HTML pages,
 * following the same README/index rule the build pipeline uses when it
 * writes files:
 *
 * - `index.md` becomes `index.html`.
 * - `README.md` becomes `index.html`, unless its directory also has an index
 *   file. In that case it stays `README.html`.
 * - Any other page keeps its stem and gets `.html`.
 *
 * Fragments and query strings survive the rewrite. External URLs, anchors
 * and assets are left untouched.
 */

#ifndef RENDAR_LINK_RESOLVER_HPP
#define RENDAR_LINK_RESOLVER_HPP

#include "path_classifier.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace rendar {

namespace fs = std::filesystem;

/**
 * @brief Where a link was found.
 */
struct LinkContext {
  fs::path inputRoot;        ///< Source root, used for absolute links.
  fs::path sourceRel;        ///< Linking page, relative to inputRoot.
  const DirSet &indexDirs;   ///< Directories owning an index page.
};

/**
 * @brief Result of a rewrite.
 */
struct RewrittenLink {
  std::string destination;            ///< Destination to emit.
  std::optional<std::string> warning; ///< Set when the target is missing.
};

/**
 * @brief Splits a destination at the first `#` or `?`.
 * @return (path, suffix); std::nullopt for an empty destination.
 */
std::optional<std::pair<std::string, std::string>>
splitLink(std::string_view dest);

/**
 * @brief Drops `.` segments and collapses `..` against the previous segment.
 *
 * A `..` that has nothing to pop is kept for relative paths and dropped for
 * absolute ones. Returns `.` for an empty relative result and `/` for an
 * empty absolute one.
 */
std::string normalizeLinkPath(std::string_view path);

/// `http://` or `https://`.
bool hasScheme(std::string_view dest);

/**
 * @brief `dir/name.md` to `dir/name.html`, keeping the absolute or relative
 * form of @p dest.
 */
std::string replaceMarkdownExtension(std::string_view dest);

/**
 * @brief `dir/anything.md` to `dir/index.html`.
 */
std::string directoryIndex(std::string_view dest);

/**
 * @brief Rewrites one link destination.
 * @param dest Raw destination as written in the source.
 * @param context The linking page.
 */
RewrittenLink rewriteLinkDestination(std::string_view dest,
                                     const LinkContext &context);

} // namespace rendar

#endif // RENDAR_LINK_RESOLVER_HPP
