/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file main.cpp
 * @brief rendar: renders a Markdown tree into a static HTML site.
 *
 * Commands:
 * - build: render once into an output directory
 * - check: report broken links, exit code 1 if there are any
 * - preview: serve with live reload, optionally detached as a daemon
 *
 * Dependencies:
 * - md4c (Markdown parsing)
 * - nlohmann/json (template data)
 * - pantor/inja (page templates)
 * - cpp-httplib (preview server)
 * - efsw (file watching)
 */

#include "cli.hpp"
#include "config.hpp"
#include "daemon.hpp"
#include "exclude.hpp"
#include "page_template.hpp"
#include "preview.hpp"
#include "preview_paths.hpp"
#include "site.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace rendar;

// --- Helpers ---

/**
 * @brief Loads the custom template or the built-in one and warns about
 * placeholders a custom template leaves out.
 */
PageTemplate loadTemplate(const std::optional<fs::path> &path) {
  if (!path)
    return PageTemplate::builtIn();

  PageTemplate tmpl = PageTemplate::fromPath(*path);
  auto missing = tmpl.missingPlaceholders();
  if (!missing.empty()) {
    std::string names;
    for (const auto &name : missing)
      names += (names.empty() ? "" : ", ") + name;
    std::println(stderr, "Warning: Template {} is missing placeholders: {}",
                 path->string(), names);
  }
  return tmpl;
}

// --- Commands ---

int runBuild(const CliOptions &cli) {
  auto config = loadConfig(cli.config, fs::current_path());
  fs::path input = resolveInput(cli.input, config);
  PageTemplate tmpl = loadTemplate(resolveTemplate(cli.templatePath, config));
  ExcludeSet excludes = resolveExcludes(cli.exclude, config);

  RenderOptions options;
  options.excludes = &excludes;
  options.csvMaxRows = resolveCsvMaxRows(cli.csvMaxRows, config);

  BuildReport report = buildSite(input, *cli.out, tmpl, options);
  std::println("Rendered {} pages and copied {} files to {}", report.pages,
               report.assets, cli.out->string());
  return 0;
}

int runCheck(const CliOptions &cli) {
  auto config = loadConfig(cli.config, fs::current_path());
  fs::path input = resolveInput(cli.input, config);
  ExcludeSet excludes = resolveExcludes(cli.exclude, config);

  std::size_t warnings = checkSite(input, &excludes);
  if (warnings > 0) {
    std::println(stderr, "{} warning(s) in {}", warnings, input.string());
    return 1;
  }
  std::println("No broken links in {}", input.string());
  return 0;
}

int runPreviewCommand(const CliOptions &cli,
                      const std::vector<std::string> &args) {
  if (cli.daemon) {
    spawnPreviewDaemon(args);
    return 0;
  }
  if (cli.daemonChild)
    std::signal(SIGPIPE, SIG_IGN);

  fs::path cwd = fs::current_path();
  auto config = loadConfig(cli.config, cwd);
  std::optional<fs::path> inputOverride = cli.input;
  if (!inputOverride && config)
    inputOverride = config->input;

  PreviewPaths paths = resolvePreviewPaths(cwd, inputOverride, cli.startOn);
  PageTemplate tmpl = loadTemplate(resolveTemplate(cli.templatePath, config));

  PreviewSettings settings;
  settings.input = paths.inputRoot;
  settings.startPage = paths.startPage;
  settings.excludes = resolveExcludes(cli.exclude, config);
  if (settings.startPage &&
      isExcludedPath(*settings.startPage, settings.input, &settings.excludes))
    throw std::runtime_error(std::format("Start page {} is excluded by pattern",
                                         settings.startPage->string()));
  settings.csvMaxRows = resolveCsvMaxRows(cli.csvMaxRows, config);
  if (cli.autoExitSeconds)
    settings.autoExit = std::chrono::seconds(*cli.autoExitSeconds);
  settings.port = resolvePreviewPort(cli.port, config);
  settings.open =
      resolvePreviewOpen(cli.open, cli.noOpen, cli.daemonChild, config);
  settings.daemonChild = cli.daemonChild;

  runPreview(settings, tmpl);
  return 0;
}

/**
 * @brief Main entry point.
 */
int main(int argc, char *argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  try {
    CliOptions cli = parseArgs(args);
    switch (cli.command) {
    case Command::Help:
      std::print("{}", usageText());
      return 0;
    case Command::Version:
      std::println("rendar {}", RENDAR_VERSION);
      return 0;
    case Command::Build:
      return runBuild(cli);
    case Command::Check:
      return runCheck(cli);
    case Command::Preview:
      return runPreviewCommand(cli, args);
    }
  } catch (const UsageError &e) {
    std::println(stderr, "Error: {}", e.what());
    std::println(stderr, "Run 'rendar --help' for usage.");
    return 2;
  } catch (const std::exception &e) {
    std::println(stderr, "Error: {}", e.what());
    return 1;
  }

  return 0;
}
