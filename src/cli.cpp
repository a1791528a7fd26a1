/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "cli.hpp"

#include "csv_preview.hpp"
#include "preview.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <limits>
#include <string_view>

namespace rendar {

namespace {

struct OptionSpec {
  std::string_view longName;
  char shortName;
  bool takesValue;
  std::vector<Command> commands;
};

const std::vector<OptionSpec> &optionSpecs() {
  using enum Command;
  static const std::vector<OptionSpec> specs = {
      {"out", 'o', true, {Build}},
      {"input", 'i', true, {Build, Check, Preview}},
      {"config", 'c', true, {Build, Check, Preview}},
      {"template", 0, true, {Build, Preview}},
      {"exclude", 0, true, {Build, Check, Preview}},
      {"csv-max-rows", 0, true, {Build, Preview}},
      {"start-on", 0, true, {Preview}},
      {"open", 0, false, {Preview}},
      {"no-open", 0, false, {Preview}},
      {"daemon", 0, false, {Preview}},
      {"daemon-child", 0, false, {Preview}},
      {"auto-exit", 0, false, {Preview}},
      {"port", 0, true, {Preview}},
  };
  return specs;
}

std::string_view commandName(Command command) {
  switch (command) {
  case Command::Build:
    return "build";
  case Command::Check:
    return "check";
  case Command::Preview:
    return "preview";
  default:
    return "rendar";
  }
}

bool isDigits(std::string_view text) {
  return !text.empty() && std::ranges::all_of(text, [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

template <typename T>
T parseNumber(std::string_view option, std::string_view value, T max) {
  std::uint64_t number = 0;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), number);
  if (ec != std::errc() || ptr != value.data() + value.size() ||
      number > static_cast<std::uint64_t>(max))
    throw UsageError(
        std::format("Invalid value for --{}: {}", option, value));
  return static_cast<T>(number);
}

void applyOption(CliOptions &cli, std::string_view name,
                 const std::optional<std::string> &value) {
  if (name == "out")
    cli.out = fs::path(*value);
  else if (name == "input")
    cli.input = fs::path(*value);
  else if (name == "config")
    cli.config = fs::path(*value);
  else if (name == "template")
    cli.templatePath = fs::path(*value);
  else if (name == "exclude")
    cli.exclude.push_back(*value);
  else if (name == "csv-max-rows")
    cli.csvMaxRows = parseNumber<std::size_t>(
        name, *value, std::numeric_limits<std::size_t>::max());
  else if (name == "start-on")
    cli.startOn = fs::path(*value);
  else if (name == "open")
    cli.open = true;
  else if (name == "no-open")
    cli.noOpen = true;
  else if (name == "daemon")
    cli.daemon = true;
  else if (name == "daemon-child")
    cli.daemonChild = true;
  else if (name == "auto-exit")
    cli.autoExitSeconds =
        value ? parseNumber<std::uint64_t>(
                    name, *value, std::numeric_limits<std::uint32_t>::max())
              : kDefaultAutoExitSeconds;
  else if (name == "port") {
    std::uint16_t port = parseNumber<std::uint16_t>(
        name, *value, std::numeric_limits<std::uint16_t>::max());
    if (port == 0)
      throw UsageError("Invalid value for --port: 0");
    cli.port = port;
  }
}

} // namespace

CliOptions parseArgs(const std::vector<std::string> &args) {
  CliOptions cli;
  if (args.empty())
    return cli;

  const std::string &first = args.front();
  if (first == "--help" || first == "-h" || first == "help")
    return cli;
  if (first == "--version" || first == "-V") {
    cli.command = Command::Version;
    return cli;
  }
  if (first == "build")
    cli.command = Command::Build;
  else if (first == "check")
    cli.command = Command::Check;
  else if (first == "preview")
    cli.command = Command::Preview;
  else
    throw UsageError(std::format("Unknown command: {}", first));

  for (std::size_t i = 1; i < args.size(); ++i) {
    std::string_view arg = args[i];
    if (arg == "--help" || arg == "-h") {
      cli.command = Command::Help;
      return cli;
    }

    std::string_view name;
    std::optional<std::string> inlineValue;
    if (arg.starts_with("--")) {
      name = arg.substr(2);
      if (auto eq = name.find('='); eq != std::string_view::npos) {
        inlineValue = std::string(name.substr(eq + 1));
        name = name.substr(0, eq);
      }
    } else if (arg.size() == 2 && arg.front() == '-') {
      auto it = std::ranges::find(optionSpecs(), arg[1], &OptionSpec::shortName);
      if (it == optionSpecs().end())
        throw UsageError(std::format("Unknown option {}", arg));
      name = it->longName;
    } else {
      throw UsageError(std::format("Unexpected argument: {}", arg));
    }

    auto spec = std::ranges::find(optionSpecs(), name, &OptionSpec::longName);
    if (spec == optionSpecs().end() ||
        std::ranges::find(spec->commands, cli.command) == spec->commands.end())
      throw UsageError(std::format("Unknown option --{} for {}", name,
                                   commandName(cli.command)));

    std::optional<std::string> value = inlineValue;
    if (spec->takesValue && !value) {
      if (i + 1 >= args.size())
        throw UsageError(std::format("Missing value for --{}", name));
      value = args[++i];
    } else if (!spec->takesValue && value && name != "auto-exit") {
      throw UsageError(std::format("Option --{} takes no value", name));
    } else if (name == "auto-exit" && !value && i + 1 < args.size() &&
               isDigits(args[i + 1])) {
      value = args[++i];
    }

    applyOption(cli, name, value);
  }

  if (cli.command == Command::Build && !cli.out)
    throw UsageError("Missing required option --out");
  if (cli.open && cli.noOpen)
    throw UsageError("Cannot use --open and --no-open together");
  if (cli.daemon && cli.daemonChild)
    throw UsageError("Cannot use --daemon and --daemon-child together");
  return cli;
}

std::string usageText() {
  return std::format(
      R"(rendar {} - render a Markdown tree into a static HTML site

Usage:
  rendar build   --out <dir> [--input <dir>] [--config <file>] [--template <file>]
                 [--exclude <glob>]... [--csv-max-rows <n>]
  rendar check   [--input <dir>] [--config <file>] [--exclude <glob>]...
  rendar preview [--input <dir>] [--config <file>] [--template <file>]
                 [--start-on <path>] [--open | --no-open] [--daemon]
                 [--auto-exit [<seconds>]] [--port <n>] [--exclude <glob>]...
                 [--csv-max-rows <n>]
  rendar --help | --version

Commands:
  build     Render Markdown and CSV files into the output directory.
  check     Report broken links without writing output. Exits 1 on warnings.
  preview   Serve the site with live reload.

Options:
  -o, --out <dir>         Output directory for generated HTML.
  -i, --input <dir>       Input directory (defaults to the current directory).
  -c, --config <file>     Config file (defaults to ./{} if present).
      --template <file>   Page template (inja syntax).
      --exclude <glob>    Exclude matching paths; repeatable.
      --csv-max-rows <n>  Maximum CSV rows per page, 0 for all (default {}).
      --start-on <path>   Page or directory to open first.
      --open, --no-open   Open the browser after starting, or don't.
      --daemon            Run the preview in the background; prints URL and PID.
      --auto-exit [<s>]   Stop after <s> seconds without open pages (default {}).
      --port <n>          Preview port (default {}).
)",
      RENDAR_VERSION, kConfigFileName, kDefaultCsvMaxRows,
      kDefaultAutoExitSeconds, kDefaultPreviewPort);
}

fs::path resolveInput(const std::optional<fs::path> &cli,
                      const std::optional<Config> &config) {
  if (cli)
    return *cli;
  if (config && config->input)
    return *config->input;
  return fs::path(".");
}

std::optional<fs::path> resolveTemplate(const std::optional<fs::path> &cli,
                                        const std::optional<Config> &config) {
  if (cli)
    return cli;
  if (config)
    return config->templatePath;
  return std::nullopt;
}

std::uint16_t resolvePreviewPort(std::optional<std::uint16_t> cli,
                                 const std::optional<Config> &config) {
  if (cli)
    return *cli;
  if (config && config->preview.port)
    return *config->preview.port;
  return kDefaultPreviewPort;
}

bool resolvePreviewOpen(bool open, bool noOpen, bool daemonChild,
                        const std::optional<Config> &config) {
  if (noOpen)
    return false;
  if (open || daemonChild)
    return true;
  return config && config->preview.open.value_or(false);
}

ExcludeSet resolveExcludes(const std::vector<std::string> &cli,
                           const std::optional<Config> &config) {
  if (!cli.empty())
    return ExcludeSet(cli);
  if (config && config->exclude)
    return ExcludeSet(*config->exclude);
  return ExcludeSet();
}

std::optional<std::size_t>
resolveCsvMaxRows(std::optional<std::size_t> cli,
                  const std::optional<Config> &config) {
  std::size_t rows = kDefaultCsvMaxRows;
  if (cli)
    rows = *cli;
  else if (config && config->csvMaxRows)
    rows = *config->csvMaxRows;
  if (rows == 0)
    return std::nullopt;
  return rows;
}

} // namespace rendar
