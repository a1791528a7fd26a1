/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "exclude.hpp"

#include <format>
#include <stdexcept>
#include <utility>

namespace rendar {

namespace {

/// Index of the `]` closing the class opened at @p open, or npos.
std::size_t classEnd(std::string_view pattern, std::size_t open) {
  std::size_t i = open + 1;
  if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^'))
    ++i;
  // A leading ']' is a literal member.
  if (i < pattern.size() && pattern[i] == ']')
    ++i;
  while (i < pattern.size() && pattern[i] != ']')
    ++i;
  return i < pattern.size() ? i : std::string_view::npos;
}

bool classMatches(std::string_view cls, char ch) {
  bool negate = false;
  std::size_t i = 0;
  if (!cls.empty() && (cls[0] == '!' || cls[0] == '^')) {
    negate = true;
    i = 1;
  }
  bool found = false;
  bool first = true;
  while (i < cls.size()) {
    char lo = cls[i];
    if (lo == ']' && !first)
      break;
    first = false;
    if (i + 2 < cls.size() && cls[i + 1] == '-' && cls[i + 2] != ']') {
      char hi = cls[i + 2];
      if (lo <= ch && ch <= hi)
        found = true;
      i += 3;
    } else {
      if (lo == ch)
        found = true;
      ++i;
    }
  }
  return found != negate;
}

bool matchFrom(std::string_view pattern, std::string_view text) {
  std::size_t pi = 0;
  std::size_t ti = 0;
  while (pi < pattern.size()) {
    char c = pattern[pi];
    if (c == '*') {
      if (pattern.substr(pi).starts_with("**/") &&
          matchFrom(pattern.substr(pi + 3), text.substr(ti)))
        return true;
      while (pi < pattern.size() && pattern[pi] == '*')
        ++pi;
      if (pi == pattern.size())
        return true;
      for (std::size_t k = ti; k <= text.size(); ++k) {
        if (matchFrom(pattern.substr(pi), text.substr(k)))
          return true;
      }
      return false;
    }
    if (ti >= text.size())
      return false;
    if (c == '?') {
      ++pi;
      ++ti;
      continue;
    }
    if (c == '[') {
      std::size_t end = classEnd(pattern, pi);
      if (end != std::string_view::npos) {
        if (!classMatches(pattern.substr(pi + 1, end - pi - 1), text[ti]))
          return false;
        pi = end + 1;
        ++ti;
        continue;
      }
    }
    if (c == '\\' && pi + 1 < pattern.size())
      c = pattern[++pi];
    if (c != text[ti])
      return false;
    ++pi;
    ++ti;
  }
  return ti == text.size();
}

} // namespace

bool globMatch(std::string_view pattern, std::string_view text) {
  return matchFrom(pattern, text);
}

ExcludeSet::ExcludeSet(std::vector<std::string> patterns)
    : patterns_(std::move(patterns)) {
  for (const auto &pattern : patterns_) {
    if (pattern.empty())
      throw std::invalid_argument("Invalid exclude pattern: empty pattern");
    for (std::size_t i = 0; i < pattern.size(); ++i) {
      if (pattern[i] == '\\') {
        ++i;
      } else if (pattern[i] == '[') {
        std::size_t end = classEnd(pattern, i);
        if (end == std::string_view::npos)
          throw std::invalid_argument(std::format(
              "Invalid exclude pattern: {} (unclosed character class)",
              pattern));
        i = end;
      }
    }
  }
}

bool ExcludeSet::matches(const fs::path &relativePath) const {
  std::string text = relativePath.generic_string();
  for (const auto &pattern : patterns_) {
    if (globMatch(pattern, text))
      return true;
  }
  return false;
}

bool isExcludedPath(const fs::path &path, const fs::path &inputRoot,
                    const ExcludeSet *excludes) {
  if (excludes == nullptr || excludes->empty())
    return false;

  fs::path rel = path.lexically_normal().lexically_relative(
      inputRoot.lexically_normal());
  if (rel.empty() || *rel.begin() == "..") {
    std::error_code ec;
    fs::path absPath = fs::weakly_canonical(path, ec);
    if (ec)
      return false;
    fs::path absRoot = fs::weakly_canonical(inputRoot, ec);
    if (ec)
      return false;
    rel = absPath.lexically_relative(absRoot);
  }
  if (rel.empty() || rel == "." || *rel.begin() == "..")
    return false;

  fs::path prefix;
  for (const auto &part : rel) {
    prefix /= part;
    if (excludes->matches(prefix))
      return true;
  }
  return false;
}

} // namespace rendar
