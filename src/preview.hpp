/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

/**
 * @file preview.hpp
 * @brief Live preview: watch, debounce, rebuild, serve.
 *
 * Three flows share one PreviewState:
 * - the watcher thread of efsw feeding a ChangeQueue, drained by a
 *   RebuildLoop that is the only writer of the output tree;
 * - the HTTP workers of PreviewServer reading the output tree and the
 *   version;
 * - an optional IdleMonitor stopping the server once no page has reported
 *   a heartbeat for the auto-exit timeout.
 */

#ifndef RENDAR_PREVIEW_HPP
#define RENDAR_PREVIEW_HPP

#include "exclude.hpp"
#include "page_template.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include <efsw/efsw.hpp>
#include <httplib.h>

namespace rendar {

namespace fs = std::filesystem;

inline constexpr std::uint16_t kDefaultPreviewPort = 3000;
inline constexpr std::string_view kVersionEndpoint = "/__rendar_version";
inline constexpr std::string_view kHeartbeatEndpoint = "/__rendar_heartbeat";

/// Wall clock in milliseconds since the epoch.
std::uint64_t nowMillis();

/**
 * @brief State shared between the rebuild loop and the HTTP layer.
 */
struct PreviewState {
  std::atomic<std::uint64_t> version{1}; ///< Bumped after each rebuild.
  std::atomic<std::uint64_t> lastSeenMs{0};
  bool autoExit = false; ///< Heartbeats only count when set.

  void touch(std::uint64_t nowMs = nowMillis()) { lastSeenMs.store(nowMs); }
};

/**
 * @brief Counts change notifications until a consumer picks them up.
 */
class ChangeQueue {
public:
  void push();

  /**
   * @brief Blocks until a change arrives, then consumes everything pending.
   * @return false once the queue is closed.
   */
  bool waitForChange();

  /**
   * @brief Swallows follow-up changes until @p quiet passes without one, or
   * until @p maxWindow has elapsed since the call.
   */
  void drainBurst(std::chrono::milliseconds quiet,
                  std::chrono::milliseconds maxWindow);

  /// Wakes all waiters; waitForChange() returns false from now on.
  void close();

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t pending_ = 0;
  bool closed_ = false;
};

struct DebounceTiming {
  std::chrono::milliseconds quiet{200};
  std::chrono::milliseconds maxWindow{2000};
};

/**
 * @brief Turns bursts of changes into single rebuilds.
 *
 * The version is bumped once per successful rebuild. A failed rebuild is
 * logged and leaves the version alone.
 */
class RebuildLoop {
public:
  using RebuildFn = std::function<void()>;

  RebuildLoop(ChangeQueue &queue, PreviewState &state, RebuildFn rebuild,
              DebounceTiming timing = {});
  ~RebuildLoop();

  RebuildLoop(const RebuildLoop &) = delete;
  RebuildLoop &operator=(const RebuildLoop &) = delete;

  /**
   * @brief Waits for one burst and rebuilds.
   * @return false when the queue was closed instead.
   */
  bool runOnce();

  /// Runs runOnce() on a background thread until stop().
  void start();

  /// Closes the queue and joins the thread.
  void stop();

private:
  ChangeQueue &queue_;
  PreviewState &state_;
  RebuildFn rebuild_;
  DebounceTiming timing_;
  std::thread thread_;
};

/**
 * @brief Recursive efsw watch on the input tree feeding a ChangeQueue.
 *
 * Events from inside the output directory are ignored.
 */
class SourceWatcher : public efsw::FileWatchListener {
public:
  SourceWatcher(fs::path input, fs::path output, ChangeQueue &queue);
  ~SourceWatcher() override;

  SourceWatcher(const SourceWatcher &) = delete;
  SourceWatcher &operator=(const SourceWatcher &) = delete;

  /// @throws std::runtime_error if the watch cannot be installed.
  void start();

  /// Removes the watch and joins efsw's thread. Safe to call twice.
  void stop();

  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename = "") override;

private:
  fs::path input_;
  fs::path output_;
  ChangeQueue &queue_;
  std::unique_ptr<efsw::FileWatcher> watcher_;
  efsw::WatchID watchId_ = 0;
};

/**
 * @brief Fires a callback once when no heartbeat arrived for the timeout.
 */
class IdleMonitor {
public:
  using NowFn = std::function<std::uint64_t()>;

  IdleMonitor(const PreviewState &state, std::chrono::milliseconds timeout,
              std::function<void()> onIdle, NowFn now = nowMillis);
  ~IdleMonitor();

  IdleMonitor(const IdleMonitor &) = delete;
  IdleMonitor &operator=(const IdleMonitor &) = delete;

  /**
   * @brief Compares the last heartbeat against the clock.
   * @return true if the callback fired during this call.
   */
  bool checkOnce();

  /// Calls checkOnce() every @p tick on a background thread.
  void start(std::chrono::milliseconds tick = std::chrono::seconds(1));
  void stop();

  bool fired() const { return fired_.load(); }

private:
  const PreviewState &state_;
  std::chrono::milliseconds timeout_;
  std::function<void()> onIdle_;
  NowFn now_;
  std::atomic<bool> fired_{false};

  std::mutex mutex_;
  std::condition_variable cv_;
  bool stopping_ = false;
  std::thread thread_;
};

/**
 * @brief HTTP front of the preview: static files plus the version and
 * heartbeat endpoints.
 */
class PreviewServer {
public:
  PreviewServer(fs::path root, PreviewState &state);

  /**
   * @brief Binds 127.0.0.1 on @p preferredPort.
   *
   * Only the default port falls back to a random free one, with a notice on
   * stderr.
   *
   * @return The bound port.
   * @throws std::runtime_error if binding fails.
   */
  std::uint16_t bind(std::uint16_t preferredPort);

  /// Serves until stop(). Blocks.
  void run();

  /// Returns after in-flight requests finish. Callable from any thread.
  void stop();

  std::uint16_t port() const { return port_; }

private:
  fs::path root_;
  PreviewState &state_;
  httplib::Server server_;
  std::uint16_t port_ = 0;
};

/**
 * @brief Everything a preview session needs, resolved by the CLI.
 */
struct PreviewSettings {
  fs::path input;
  std::optional<fs::path> startPage; ///< Absolute path of the first page.
  ExcludeSet excludes;
  std::optional<std::size_t> csvMaxRows;
  std::optional<std::chrono::seconds> autoExit;
  std::uint16_t port = kDefaultPreviewPort;
  bool open = false;
  bool daemonChild = false; ///< Print the URL=/PID= handoff lines.
};

/**
 * @brief URL of the start page, or of the site root.
 */
std::string previewStartUrl(const PreviewSettings &settings,
                            std::uint16_t port);

/**
 * @brief Opens @p url in the desktop browser. Failure is reported, not
 * thrown.
 */
void openBrowser(const std::string &url);

/**
 * @brief Builds into a temporary directory and serves it until the idle
 * monitor or a fatal error ends the session.
 */
void runPreview(const PreviewSettings &settings,
                const PageTemplate &pageTemplate);

} // namespace rendar

#endif // RENDAR_PREVIEW_HPP
