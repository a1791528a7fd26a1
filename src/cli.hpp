/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file cli.hpp
 * @brief Command line parsing and the precedence rules between command line
 * arguments, `rendar.toml` and built-in defaults.
 */

#ifndef RENDAR_CLI_HPP
#define RENDAR_CLI_HPP

#include "config.hpp"
#include "exclude.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef RENDAR_VERSION
#define RENDAR_VERSION "0.0.0"
#endif

namespace rendar {

namespace fs = std::filesystem;

/// Seconds of inactivity before `--auto-exit` without a value shuts down.
inline constexpr std::uint64_t kDefaultAutoExitSeconds = 30;

/**
 * @brief Malformed or conflicting command line.
 */
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class Command { Help, Version, Build, Check, Preview };

struct CliOptions {
  Command command = Command::Help;
  std::optional<fs::path> out;
  std::optional<fs::path> input;
  std::optional<fs::path> config;
  std::optional<fs::path> templatePath;
  std::optional<fs::path> startOn;
  std::vector<std::string> exclude;
  std::optional<std::size_t> csvMaxRows;
  std::optional<std::uint64_t> autoExitSeconds;
  std::optional<std::uint16_t> port;
  bool open = false;
  bool noOpen = false;
  bool daemon = false;
  bool daemonChild = false;
};

/**
 * @brief Parses the arguments after the program name.
 * @throws UsageError for unknown commands or options, missing values and
 * conflicting flags.
 */
CliOptions parseArgs(const std::vector<std::string> &args);

/// Help text listing all commands and options.
std::string usageText();

fs::path resolveInput(const std::optional<fs::path> &cli,
                      const std::optional<Config> &config);

std::optional<fs::path> resolveTemplate(const std::optional<fs::path> &cli,
                                        const std::optional<Config> &config);

std::uint16_t resolvePreviewPort(std::optional<std::uint16_t> cli,
                                 const std::optional<Config> &config);

/**
 * @brief `--no-open` wins, then `--open` or being a daemon child, then the
 * `[preview] open` setting. Defaults to false.
 */
bool resolvePreviewOpen(bool open, bool noOpen, bool daemonChild,
                        const std::optional<Config> &config);

/**
 * @brief Exclude patterns from the command line, or else from the config.
 * @throws std::invalid_argument for a malformed pattern.
 */
ExcludeSet resolveExcludes(const std::vector<std::string> &cli,
                           const std::optional<Config> &config);

/**
 * @brief Row limit for CSV previews; std::nullopt means unlimited.
 */
std::optional<std::size_t>
resolveCsvMaxRows(std::optional<std::size_t> cli,
                  const std::optional<Config> &config);

} // namespace rendar

#endif // RENDAR_CLI_HPP
