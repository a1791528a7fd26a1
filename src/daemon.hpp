/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file daemon.hpp
 * @brief Background preview: re-exec as a detached child and relay its
 * handoff lines.
 *
 * The child runs the same command line with `--daemon` replaced by
 * `--daemon-child`. Once serving, it prints `URL=<start url>` and
 * `PID=<pid>` on stdout; the parent relays both and exits.
 */

#ifndef RENDAR_DAEMON_HPP
#define RENDAR_DAEMON_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rendar {

namespace fs = std::filesystem;

inline constexpr std::chrono::seconds kHandoffTimeout{5};

struct DaemonHandoff {
  std::optional<std::string> urlLine; ///< Full `URL=...` line.
  std::optional<std::string> pidLine; ///< Full `PID=...` line.

  bool complete() const { return urlLine && pidLine; }
};

/**
 * @brief Arguments for the child: the first `--daemon` becomes
 * `--daemon-child`, later ones are dropped, and the marker is appended if
 * there was none.
 * @param args Command line without the program name.
 */
std::vector<std::string> daemonChildArgs(const std::vector<std::string> &args);

/**
 * @brief Reads lines from @p fd until both handoff lines arrived, the
 * stream ends or @p timeout passes.
 */
DaemonHandoff readHandoff(int fd, std::chrono::milliseconds timeout);

/**
 * @brief Starts the detached child and prints its handoff lines.
 * @param args Command line without the program name.
 * @throws std::runtime_error if the child cannot be started.
 */
DaemonHandoff spawnPreviewDaemon(const std::vector<std::string> &args);

/**
 * @brief Points stdout at /dev/null so writes after the parent has gone
 * cannot fail on a closed pipe.
 */
void detachStdout();

/// Path of the running executable.
fs::path currentExecutable();

} // namespace rendar

#endif // RENDAR_DAEMON_HPP
