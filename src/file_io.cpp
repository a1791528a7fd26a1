/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "file_io.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace rendar {

namespace {

void ensureParent(const fs::path &path) {
  fs::path parent = path.parent_path();
  if (parent.empty())
    return;
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec)
    throw std::runtime_error(
        std::format("Failed to create output directory {}: {}",
                    parent.string(), ec.message()));
}

} // namespace

std::string readFile(const fs::path &path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in)
    throw std::runtime_error(
        std::format("Could not read file: {}", path.string()));
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  return content;
}

void writeFile(const fs::path &path, std::string_view content) {
  ensureParent(path);
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out)
    throw std::runtime_error(
        std::format("Could not write file: {}", path.string()));
  out << content;
  if (!out)
    throw std::runtime_error(
        std::format("Could not write file: {}", path.string()));
}

void copyFile(const fs::path &from, const fs::path &to) {
  ensureParent(to);
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec)
    throw std::runtime_error(
        std::format("Failed to copy asset from {} to {}: {}", from.string(),
                    to.string(), ec.message()));
}

std::string escapeHtml(std::string_view input) {
  std::string escaped;
  escaped.reserve(input.size());
  for (char ch : input) {
    switch (ch) {
    case '&':
      escaped += "&amp;";
      break;
    case '<':
      escaped += "&lt;";
      break;
    case '>':
      escaped += "&gt;";
      break;
    case '"':
      escaped += "&quot;";
      break;
    case '\'':
      escaped += "&#39;";
      break;
    default:
      escaped += ch;
    }
  }
  return escaped;
}

} // namespace rendar
