/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "daemon.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <print>
#include <stdexcept>
#include <string_view>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <unistd.h>

extern char **environ;

namespace rendar {

namespace {

constexpr std::string_view kDaemonFlag = "--daemon";
constexpr std::string_view kDaemonChildFlag = "--daemon-child";

void takeLine(std::string_view line, DaemonHandoff &handoff) {
  if (!line.empty() && line.back() == '\r')
    line.remove_suffix(1);
  if (line.starts_with("URL="))
    handoff.urlLine = std::string(line);
  else if (line.starts_with("PID="))
    handoff.pidLine = std::string(line);
}

/// Closes a file descriptor on scope exit.
class FdGuard {
public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() { reset(); }
  FdGuard(const FdGuard &) = delete;
  FdGuard &operator=(const FdGuard &) = delete;

  int get() const { return fd_; }

  void reset() {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = -1;
  }

private:
  int fd_;
};

} // namespace

std::vector<std::string> daemonChildArgs(const std::vector<std::string> &args) {
  std::vector<std::string> out;
  out.reserve(args.size() + 1);
  bool replaced = false;
  for (const auto &arg : args) {
    if (arg == kDaemonFlag) {
      if (!replaced) {
        out.emplace_back(kDaemonChildFlag);
        replaced = true;
      }
      continue;
    }
    out.push_back(arg);
  }
  if (!replaced)
    out.emplace_back(kDaemonChildFlag);
  return out;
}

DaemonHandoff readHandoff(int fd, std::chrono::milliseconds timeout) {
  using Clock = std::chrono::steady_clock;
  auto deadline = Clock::now() + timeout;

  DaemonHandoff handoff;
  std::string buffer;
  char chunk[512];

  while (!handoff.complete()) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    if (left.count() <= 0)
      break;

    pollfd pfd{fd, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(left.count()));
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      throw std::runtime_error(std::format(
          "Failed to read preview daemon output: {}", std::strerror(errno)));
    }
    if (ready == 0)
      break;

    ssize_t n = ::read(fd, chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw std::runtime_error(std::format(
          "Failed to read preview daemon output: {}", std::strerror(errno)));
    }
    if (n == 0)
      break;

    buffer.append(chunk, static_cast<std::size_t>(n));
    std::size_t newline;
    while ((newline = buffer.find('\n')) != std::string::npos) {
      takeLine(std::string_view(buffer).substr(0, newline), handoff);
      buffer.erase(0, newline + 1);
    }
  }

  if (!buffer.empty())
    takeLine(buffer, handoff);
  return handoff;
}

fs::path currentExecutable() {
  std::error_code ec;
  fs::path exe = fs::read_symlink("/proc/self/exe", ec);
  if (ec)
    throw std::runtime_error(std::format(
        "Failed to read current executable path: {}", ec.message()));
  return exe;
}

DaemonHandoff spawnPreviewDaemon(const std::vector<std::string> &args) {
  std::string exe = currentExecutable().string();
  std::vector<std::string> childArgs = daemonChildArgs(args);

  std::vector<char *> argv;
  argv.push_back(exe.data());
  for (auto &arg : childArgs)
    argv.push_back(arg.data());
  argv.push_back(nullptr);

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0)
    throw std::runtime_error(std::format(
        "Failed to capture preview daemon output: {}", std::strerror(errno)));
  FdGuard readEnd(fds[0]);
  FdGuard writeEnd(fds[1]);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, writeEnd.get(), STDOUT_FILENO);

  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSID);

  pid_t pid = 0;
  int rc = ::posix_spawn(&pid, exe.c_str(), &actions, &attr, argv.data(),
                         environ);
  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);
  if (rc != 0)
    throw std::runtime_error(std::format("Failed to spawn preview daemon: {}",
                                         std::strerror(rc)));

  // Only the child may hold the write end, so EOF means it is gone.
  writeEnd.reset();
  DaemonHandoff handoff = readHandoff(readEnd.get(), kHandoffTimeout);

  if (handoff.urlLine)
    std::println("{}", *handoff.urlLine);
  if (handoff.pidLine)
    std::println("{}", *handoff.pidLine);
  if (!handoff.complete())
    std::println(stderr,
                 "Warning: Preview daemon did not report its URL and PID "
                 "within {} seconds",
                 kHandoffTimeout.count());
  return handoff;
}

void detachStdout() {
  std::fflush(stdout);
  int devNull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
  if (devNull < 0) {
    std::println(stderr, "Warning: Failed to open /dev/null: {}",
                 std::strerror(errno));
    return;
  }
  if (::dup2(devNull, STDOUT_FILENO) < 0)
    std::println(stderr, "Warning: Failed to detach stdout: {}",
                 std::strerror(errno));
  ::close(devNull);
}

} // namespace rendar
