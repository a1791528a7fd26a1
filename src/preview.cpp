/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "preview.hpp"

#include "daemon.hpp"
#include "path_classifier.hpp"
#include "site.hpp"
#include "site_map.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <print>
#include <stdexcept>
#include <vector>

#include <spawn.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace rendar {

namespace {

constexpr const char *kPreviewHost = "127.0.0.1";

/**
 * @brief Directory under the system temp dir, removed with its content on
 * destruction.
 */
class TempDir {
public:
  explicit TempDir(std::string_view prefix) {
    std::string pattern =
        (fs::temp_directory_path() / std::format("{}-XXXXXX", prefix)).string();
    if (::mkdtemp(pattern.data()) == nullptr)
      throw std::runtime_error(std::format(
          "Failed to create preview directory: {}", std::strerror(errno)));
    path_ = pattern;
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
      std::println(stderr, "Warning: Failed to remove {}: {}", path_.string(),
                   ec.message());
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

} // namespace

std::uint64_t nowMillis() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch())
          .count());
}

// --- ChangeQueue ---

void ChangeQueue::push() {
  {
    std::lock_guard lock(mutex_);
    ++pending_;
  }
  cv_.notify_all();
}

bool ChangeQueue::waitForChange() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return pending_ > 0 || closed_; });
  if (closed_)
    return false;
  pending_ = 0;
  return true;
}

void ChangeQueue::drainBurst(std::chrono::milliseconds quiet,
                             std::chrono::milliseconds maxWindow) {
  auto start = std::chrono::steady_clock::now();
  std::unique_lock lock(mutex_);
  pending_ = 0;
  while (cv_.wait_for(lock, quiet, [this] { return pending_ > 0 || closed_; })) {
    if (closed_)
      return;
    pending_ = 0;
    if (std::chrono::steady_clock::now() - start > maxWindow)
      return;
  }
}

void ChangeQueue::close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

// --- RebuildLoop ---

RebuildLoop::RebuildLoop(ChangeQueue &queue, PreviewState &state,
                         RebuildFn rebuild, DebounceTiming timing)
    : queue_(queue), state_(state), rebuild_(std::move(rebuild)),
      timing_(timing) {}

RebuildLoop::~RebuildLoop() { stop(); }

bool RebuildLoop::runOnce() {
  if (!queue_.waitForChange())
    return false;
  queue_.drainBurst(timing_.quiet, timing_.maxWindow);

  try {
    rebuild_();
  } catch (const std::exception &e) {
    std::println(stderr, "Failed to rebuild preview: {}", e.what());
    return true;
  }
  state_.version.fetch_add(1);
  return true;
}

void RebuildLoop::start() {
  thread_ = std::thread([this] {
    while (runOnce()) {
    }
  });
}

void RebuildLoop::stop() {
  queue_.close();
  if (thread_.joinable())
    thread_.join();
}

// --- SourceWatcher ---

SourceWatcher::SourceWatcher(fs::path input, fs::path output,
                             ChangeQueue &queue)
    : input_(std::move(input)), output_(std::move(output)), queue_(queue) {}

SourceWatcher::~SourceWatcher() { stop(); }

void SourceWatcher::start() {
  watcher_ = std::make_unique<efsw::FileWatcher>();
  watchId_ = watcher_->addWatch(input_.string(), this, true);
  if (watchId_ < 0) {
    watcher_.reset();
    throw std::runtime_error(
        std::format("Failed to watch input directory {}: {}", input_.string(),
                    efsw::Errors::Log::getLastErrorLog()));
  }
  watcher_->watch();
}

void SourceWatcher::stop() {
  if (!watcher_)
    return;
  watcher_->removeWatch(watchId_);
  // The destructor joins efsw's thread.
  watcher_.reset();
}

void SourceWatcher::handleFileAction(efsw::WatchID, const std::string &dir,
                                     const std::string &filename,
                                     efsw::Action, std::string) {
  fs::path changed = fs::path(dir) / filename;
  if (!output_.empty() && isInside(changed, output_))
    return;
  queue_.push();
}

// --- IdleMonitor ---

IdleMonitor::IdleMonitor(const PreviewState &state,
                         std::chrono::milliseconds timeout,
                         std::function<void()> onIdle, NowFn now)
    : state_(state), timeout_(timeout), onIdle_(std::move(onIdle)),
      now_(std::move(now)) {}

IdleMonitor::~IdleMonitor() { stop(); }

bool IdleMonitor::checkOnce() {
  if (fired_.load())
    return false;

  std::uint64_t now = now_();
  std::uint64_t lastSeen = state_.lastSeenMs.load();
  std::uint64_t elapsed = now > lastSeen ? now - lastSeen : 0;
  if (elapsed < static_cast<std::uint64_t>(timeout_.count()))
    return false;

  fired_.store(true);
  onIdle_();
  return true;
}

void IdleMonitor::start(std::chrono::milliseconds tick) {
  thread_ = std::thread([this, tick] {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
      if (cv_.wait_for(lock, tick, [this] { return stopping_; }))
        break;
      lock.unlock();
      bool done = checkOnce();
      lock.lock();
      if (done)
        break;
    }
  });
}

void IdleMonitor::stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

// --- PreviewServer ---

PreviewServer::PreviewServer(fs::path root, PreviewState &state)
    : root_(std::move(root)), state_(state) {
  // SO_REUSEADDR only: a port held by another preview must fail to bind.
  server_.set_socket_options([](httplib::socket_t sock) {
    int yes = 1;
    ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
  });
  if (!server_.set_mount_point("/", root_.string()))
    throw std::runtime_error(
        std::format("Failed to serve preview directory {}", root_.string()));

  server_.Get(std::string(kVersionEndpoint),
              [this](const httplib::Request &, httplib::Response &res) {
                res.set_header("Cache-Control", "no-store");
                res.set_content(std::to_string(state_.version.load()),
                                "text/plain");
              });

  auto heartbeat = [this](const httplib::Request &, httplib::Response &res) {
    if (state_.autoExit)
      state_.touch();
    res.status = 204;
  };
  server_.Get(std::string(kHeartbeatEndpoint), heartbeat);
  server_.Post(std::string(kHeartbeatEndpoint), heartbeat);
}

std::uint16_t PreviewServer::bind(std::uint16_t preferredPort) {
  if (server_.bind_to_port(kPreviewHost, preferredPort)) {
    port_ = preferredPort;
    return port_;
  }
  if (preferredPort != kDefaultPreviewPort)
    throw std::runtime_error(std::format(
        "Failed to bind preview server on {}", preferredPort));

  int fallback = server_.bind_to_any_port(kPreviewHost);
  if (fallback < 0)
    throw std::runtime_error(std::format(
        "Failed to bind preview server on {} and auto-select fallback port",
        preferredPort));
  std::println(stderr, "Port {} is in use, picked a random available port.",
               preferredPort);
  port_ = static_cast<std::uint16_t>(fallback);
  return port_;
}

void PreviewServer::run() {
  if (!server_.listen_after_bind())
    throw std::runtime_error("Preview server failed");
}

void PreviewServer::stop() { server_.stop(); }

// --- Session ---

std::string previewStartUrl(const PreviewSettings &settings,
                            std::uint16_t port) {
  std::string base = std::format("http://{}:{}/", kPreviewHost, port);
  if (!settings.startPage)
    return base;

  SiteMap map = buildSiteMap(settings.input, &settings.excludes);
  fs::path rel = fs::relative(*settings.startPage, settings.input);
  if (rel.empty() || *rel.begin() == "..")
    return base;
  return base + pathToUrl(outputRelPath(rel, map.indexDirs));
}

void openBrowser(const std::string &url) {
#ifdef __APPLE__
  std::string program = "open";
#else
  std::string program = "xdg-open";
#endif
  std::string arg = url;
  std::vector<char *> argv{program.data(), arg.data(), nullptr};

  pid_t pid = 0;
  int rc = ::posix_spawnp(&pid, program.c_str(), nullptr, nullptr, argv.data(),
                          environ);
  if (rc != 0) {
    std::println(stderr, "Warning: Failed to open browser: {}",
                 std::strerror(rc));
    return;
  }
  std::thread([pid] {
    int status = 0;
    ::waitpid(pid, &status, 0);
  }).detach();
}

void runPreview(const PreviewSettings &settings,
                const PageTemplate &pageTemplate) {
  TempDir output("rendar-preview");

  PreviewState state;
  state.autoExit = settings.autoExit.has_value();
  state.touch();

  RenderOptions options;
  options.liveReload = true;
  options.heartbeat = state.autoExit;
  options.excludes = &settings.excludes;
  options.csvMaxRows = settings.csvMaxRows;
  buildSite(settings.input, output.path(), pageTemplate, options);

  PageTemplate watcherTemplate(pageTemplate);
  ChangeQueue queue;
  RebuildLoop rebuilds(queue, state, [&] {
    buildSite(settings.input, output.path(), watcherTemplate, options);
  });
  SourceWatcher watcher(settings.input, output.path(), queue);
  watcher.start();
  rebuilds.start();

  PreviewServer server(output.path(), state);
  std::uint16_t port = server.bind(settings.port);
  std::string url = previewStartUrl(settings, port);

  if (settings.daemonChild) {
    std::println("URL={}", url);
    std::println("PID={}", ::getpid());
    detachStdout();
  } else {
    std::println("Preview server running at {}", url);
  }
  if (settings.open)
    openBrowser(url);

  std::optional<IdleMonitor> monitor;
  if (settings.autoExit) {
    monitor.emplace(state, *settings.autoExit, [&server] { server.stop(); });
    monitor->start();
  }

  server.run();
}

} // namespace rendar
