/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file path_classifier.hpp
 * @brief Stateless predicates deciding what a source path is.
 *
 * Content files are the pages of the site: Markdown (`.md`, `.markdown`) and
 * CSV (`.csv`), matched case-insensitively. Everything else is an asset and
 * is copied verbatim.
 */

#ifndef RENDAR_PATH_CLASSIFIER_HPP
#define RENDAR_PATH_CLASSIFIER_HPP

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace rendar {

namespace fs = std::filesystem;

/// Set of input-relative directories; the input root itself is the empty
/// path.
using DirSet = std::set<fs::path>;

/**
 * @brief Brings an input-relative directory into the form stored in a
 * DirSet: lexically normal, no trailing separator, "" for the root.
 */
fs::path normalizeRelDir(const fs::path &dir);

/// ASCII lower-casing.
std::string toLower(std::string_view text);

/**
 * @brief True when the extension names a Markdown file.
 */
bool isMarkdownFile(const fs::path &path);

/**
 * @brief True when the extension names a CSV file.
 */
bool isCsvFile(const fs::path &path);

/**
 * @brief True for every file that becomes an HTML page.
 */
bool isContentFile(const fs::path &path);

/**
 * @brief Content file whose stem is "readme" (any case).
 */
bool isReadme(const fs::path &path);

/**
 * @brief Content file whose stem is "index" (any case).
 */
bool isIndex(const fs::path &path);

/**
 * @brief Checks whether @p path lies inside @p root.
 *
 * Both paths are canonicalized first (symlinks and `..` resolved). If that
 * fails, e.g. because the path does not exist yet, the literal path is used
 * instead.
 *
 * @param path Path to test.
 * @param root Directory that may contain it.
 * @return true if @p root is a component-wise prefix of @p path.
 */
bool isInside(const fs::path &path, const fs::path &root);

/**
 * @brief Turns a file or directory name into a label: `-` and `_` become
 * spaces.
 */
std::string humanizeName(std::string_view name);

} // namespace rendar

#endif // RENDAR_PATH_CLASSIFIER_HPP
