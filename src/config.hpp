/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file config.hpp
 * @brief `rendar.toml` project configuration.
 *
 * Recognized keys:
 * @code
 * input = "docs"
 * template = "theme/page.html"
 * exclude = ["drafts", "*.tmp"]
 * csv_max_rows = 500
 *
 * [preview]
 * port = 4040
 * open = true
 * @endcode
 *
 * Only the part of TOML these keys need is understood: comments, tables,
 * basic and literal strings, integers, booleans and string arrays. Unknown
 * keys and tables are ignored.
 */

#ifndef RENDAR_CONFIG_HPP
#define RENDAR_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace rendar {

namespace fs = std::filesystem;

/// Default configuration file name, looked up in the working directory.
inline constexpr std::string_view kConfigFileName = "rendar.toml";

/**
 * @brief Syntax or type error in a configuration file.
 */
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct PreviewConfig {
  std::optional<std::uint16_t> port;
  std::optional<bool> open;
};

struct Config {
  std::optional<fs::path> input;        ///< Resolved against the file's dir.
  std::optional<fs::path> templatePath; ///< Resolved against the file's dir.
  std::optional<std::vector<std::string>> exclude;
  std::optional<std::size_t> csvMaxRows; ///< 0 means unlimited.
  PreviewConfig preview;
};

/**
 * @brief Parses configuration text. Paths are returned as written.
 * @param origin Name used in error messages.
 * @throws ConfigError on malformed input.
 */
Config parseConfig(std::string_view text, std::string_view origin);

/**
 * @brief Loads the configuration.
 *
 * With @p path unset, `rendar.toml` in @p cwd is used if it exists;
 * otherwise there is no configuration. Relative `input` and `template`
 * values are resolved against the directory of the file.
 *
 * @throws std::runtime_error if the file cannot be read.
 * @throws ConfigError if it cannot be parsed.
 */
std::optional<Config> loadConfig(const std::optional<fs::path> &path,
                                 const fs::path &cwd = fs::path("."));

} // namespace rendar

#endif // RENDAR_CONFIG_HPP
