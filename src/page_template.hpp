/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file page_template.hpp
 * @brief Page layout rendered with inja.
 *
 * A template receives the keys `title`, `content`, `nav`, `breadcrumbs`,
 * `style`, `extra_head` and `extra_body`. Values are inserted unescaped.
 */

#ifndef RENDAR_PAGE_TEMPLATE_HPP
#define RENDAR_PAGE_TEMPLATE_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <inja/inja.hpp>

namespace rendar {

namespace fs = std::filesystem;

class PageTemplate {
public:
  /**
   * @brief The compiled-in layout and stylesheet.
   */
  static PageTemplate builtIn();

  /**
   * @brief Loads a custom layout. Custom layouts get no stylesheet.
   * @throws std::runtime_error if the file cannot be read or parsed.
   */
  static PageTemplate fromPath(const fs::path &path);

  /**
   * @brief Parses @p source as a layout.
   * @throws inja::InjaError on a syntax error.
   */
  PageTemplate(std::string source, std::string style);

  PageTemplate(const PageTemplate &other);
  PageTemplate &operator=(const PageTemplate &) = delete;

  std::string render(std::string_view title, std::string_view content,
                     std::string_view nav, std::string_view breadcrumbs,
                     std::string_view extraHead,
                     std::string_view extraBody) const;

  /**
   * @brief Placeholders a page needs that the layout does not use.
   */
  std::vector<std::string> missingPlaceholders() const;

  const std::string &source() const { return source_; }

private:
  std::string source_;
  std::string style_;
  mutable inja::Environment env_; ///< render() is non-const in inja.
  inja::Template template_;
};

} // namespace rendar

#endif // RENDAR_PAGE_TEMPLATE_HPP
