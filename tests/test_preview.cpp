/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "preview.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace rendar;
using namespace std::chrono_literals;

namespace {

constexpr DebounceTiming kFastTiming{20ms, 200ms};

/// Polls @p done until it holds or @p limit passes.
template <typename Pred>
bool eventually(Pred done, std::chrono::milliseconds limit = 3s) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (done())
      return true;
    std::this_thread::sleep_for(5ms);
  }
  return done();
}

} // namespace

// --- Debounced rebuilds ---

TEST(ChangeQueue, ClosedQueueStopsWaiting) {
  ChangeQueue queue;
  queue.close();
  EXPECT_FALSE(queue.waitForChange());
}

TEST(ChangeQueue, BurstEndsAtMaxWindow) {
  ChangeQueue queue;
  std::atomic<bool> stop{false};
  std::thread noisy([&] {
    while (!stop.load()) {
      queue.push();
      std::this_thread::sleep_for(5ms);
    }
  });

  auto start = std::chrono::steady_clock::now();
  queue.drainBurst(100ms, 150ms);
  auto elapsed = std::chrono::steady_clock::now() - start;
  stop.store(true);
  noisy.join();

  EXPECT_GE(elapsed, 150ms);
  EXPECT_LT(elapsed, 2s);
}

TEST(RebuildLoop, CoalescesBurstIntoOneRebuild) {
  ChangeQueue queue;
  PreviewState state;
  int rebuilds = 0;
  RebuildLoop loop(queue, state, [&] { ++rebuilds; }, kFastTiming);

  for (int i = 0; i < 5; ++i)
    queue.push();
  EXPECT_TRUE(loop.runOnce());
  EXPECT_EQ(rebuilds, 1);
  EXPECT_EQ(state.version.load(), 2u);
}

TEST(RebuildLoop, FailedRebuildKeepsVersion) {
  ChangeQueue queue;
  PreviewState state;
  RebuildLoop loop(
      queue, state, [] { throw std::runtime_error("template vanished"); },
      kFastTiming);

  queue.push();
  EXPECT_TRUE(loop.runOnce());
  EXPECT_EQ(state.version.load(), 1u);
}

TEST(RebuildLoop, RunsInBackgroundUntilStopped) {
  ChangeQueue queue;
  PreviewState state;
  std::atomic<int> rebuilds{0};
  RebuildLoop loop(queue, state, [&] { ++rebuilds; }, kFastTiming);
  loop.start();

  queue.push();
  EXPECT_TRUE(eventually([&] { return state.version.load() == 2; }));
  queue.push();
  EXPECT_TRUE(eventually([&] { return state.version.load() == 3; }));

  loop.stop();
  EXPECT_EQ(rebuilds.load(), 2);
  EXPECT_FALSE(loop.runOnce());
}

TEST(SourceWatcher, ForwardsSourceChanges) {
  test::TempDir dir;
  ChangeQueue queue;
  SourceWatcher watcher(dir.path(), dir / "out", queue);
  watcher.handleFileAction(1, dir.path().string(), "page.md", efsw::Actions::Modified);
  EXPECT_TRUE(queue.waitForChange());
}

TEST(SourceWatcher, WatchesRealDirectory) {
  test::TempDir dir;
  ChangeQueue queue;
  SourceWatcher watcher(dir.path(), {}, queue);
  watcher.start();
  watcher.stop();
  watcher.stop();
}

// --- Idle shutdown ---

TEST(IdleMonitor, FiresOnceAfterTimeout) {
  PreviewState state;
  state.autoExit = true;
  state.touch(1000);

  std::uint64_t now = 1000;
  int fired = 0;
  IdleMonitor monitor(state, 500ms, [&] { ++fired; }, [&] { return now; });

  now = 1499;
  EXPECT_FALSE(monitor.checkOnce());
  now = 1500;
  EXPECT_TRUE(monitor.checkOnce());
  now = 5000;
  EXPECT_FALSE(monitor.checkOnce());
  EXPECT_EQ(fired, 1);
  EXPECT_TRUE(monitor.fired());
}

TEST(IdleMonitor, HeartbeatPostponesShutdown) {
  PreviewState state;
  state.touch(1000);

  std::uint64_t now = 1400;
  IdleMonitor monitor(state, 500ms, [] {}, [&] { return now; });
  state.touch(1400);
  now = 1800;
  EXPECT_FALSE(monitor.checkOnce());
  now = 1900;
  EXPECT_TRUE(monitor.checkOnce());
}

TEST(IdleMonitor, BackgroundThreadFires) {
  PreviewState state;
  state.touch(nowMillis() - 10'000);
  std::atomic<bool> idle{false};
  IdleMonitor monitor(state, 1s, [&] { idle.store(true); });
  monitor.start(10ms);
  EXPECT_TRUE(eventually([&] { return idle.load(); }));
  monitor.stop();
  EXPECT_TRUE(monitor.fired());
}

// --- HTTP ---

TEST(PreviewServer, ServesFilesVersionAndHeartbeat) {
  test::TempDir dir;
  test::writeText(dir / "index.html", "<p>hello</p>");

  PreviewState state;
  state.autoExit = true;
  state.touch(1);
  PreviewServer server(dir.path(), state);
  std::uint16_t port = server.bind(kDefaultPreviewPort);
  EXPECT_EQ(port, server.port());
  std::thread serving([&] { server.run(); });

  httplib::Client client("127.0.0.1", port);
  EXPECT_TRUE(eventually([&] {
    return static_cast<bool>(client.Get(std::string(kVersionEndpoint)));
  }));
  auto version = client.Get(std::string(kVersionEndpoint));
  ASSERT_TRUE(version);
  EXPECT_EQ(version->status, 200);
  EXPECT_EQ(version->body, "1");
  EXPECT_EQ(version->get_header_value("Cache-Control"), "no-store");

  state.version.store(7);
  auto bumped = client.Get(std::string(kVersionEndpoint));
  ASSERT_TRUE(bumped);
  EXPECT_EQ(bumped->body, "7");

  auto beat = client.Post(std::string(kHeartbeatEndpoint));
  ASSERT_TRUE(beat);
  EXPECT_EQ(beat->status, 204);
  EXPECT_GT(state.lastSeenMs.load(), 1u);

  auto page = client.Get("/index.html");
  ASSERT_TRUE(page);
  EXPECT_EQ(page->body, "<p>hello</p>");

  server.stop();
  serving.join();
}

TEST(PreviewServer, ExplicitPortDoesNotFallBack) {
  test::TempDir dir;
  PreviewState state;
  PreviewServer first(dir.path(), state);
  std::uint16_t taken = first.bind(kDefaultPreviewPort);

  PreviewServer second(dir.path(), state);
  if (taken == kDefaultPreviewPort) {
    // Only the default port may fall back.
    std::uint16_t other = second.bind(kDefaultPreviewPort);
    EXPECT_NE(other, kDefaultPreviewPort);
  } else {
    EXPECT_THROW(second.bind(taken), std::runtime_error);
  }
}

// --- Start URL ---

TEST(PreviewStartUrl, PointsAtRenderedPage) {
  test::TempDir dir;
  test::writeText(dir / "docs/page.md", "# Page");
  test::writeText(dir / "guide/README.md", "# Guide");

  PreviewSettings settings;
  settings.input = dir.path();
  EXPECT_EQ(previewStartUrl(settings, 4000), "http://127.0.0.1:4000/");

  settings.startPage = dir / "docs/page.md";
  EXPECT_EQ(previewStartUrl(settings, 4000),
            "http://127.0.0.1:4000/docs/page.html");

  settings.startPage = dir / "guide/README.md";
  EXPECT_EQ(previewStartUrl(settings, 4000),
            "http://127.0.0.1:4000/guide/index.html");
}
