/*
 * SPDX-License-Identifier: MIT
 * Author: Robert Zheng
 * Copyright (c) 2026 ZHENG Robert
 */

#include "daemon.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string_view>
#include <thread>

#include <unistd.h>

using namespace rendar;
using namespace std::chrono_literals;

namespace {

/// Both ends of a pipe, closed on scope exit.
class Pipe {
public:
  Pipe() {
    if (::pipe(fds_) != 0)
      throw std::runtime_error("pipe failed");
  }
  ~Pipe() {
    closeWrite();
    ::close(fds_[0]);
  }

  int readEnd() const { return fds_[0]; }

  void write(std::string_view text) {
    ASSERT_EQ(::write(fds_[1], text.data(), text.size()),
              static_cast<ssize_t>(text.size()));
  }

  void closeWrite() {
    if (fds_[1] >= 0)
      ::close(fds_[1]);
    fds_[1] = -1;
  }

private:
  int fds_[2];
};

} // namespace

TEST(DaemonArgs, ReplacesDaemonFlag) {
  EXPECT_EQ(daemonChildArgs({"preview", "--daemon", "--port", "4000"}),
            (std::vector<std::string>{"preview", "--daemon-child", "--port",
                                      "4000"}));
}

TEST(DaemonArgs, AppendsChildFlagWhenMissing) {
  EXPECT_EQ(daemonChildArgs({"preview"}),
            (std::vector<std::string>{"preview", "--daemon-child"}));
}

TEST(DaemonArgs, DropsRepeatedDaemonFlags) {
  EXPECT_EQ(daemonChildArgs({"preview", "--daemon", "--open", "--daemon"}),
            (std::vector<std::string>{"preview", "--daemon-child", "--open"}));
}

TEST(Handoff, ReadsUrlAndPidLines) {
  Pipe pipe;
  pipe.write("Port 3000 is in use\nURL=http://127.0.0.1:3001/\r\nPID=4242\n");
  DaemonHandoff handoff = readHandoff(pipe.readEnd(), 2s);
  ASSERT_TRUE(handoff.complete());
  EXPECT_EQ(*handoff.urlLine, "URL=http://127.0.0.1:3001/");
  EXPECT_EQ(*handoff.pidLine, "PID=4242");
}

TEST(Handoff, AcceptsLinesSplitAcrossWrites) {
  Pipe pipe;
  std::thread writer([&] {
    pipe.write("URL=http://loc");
    std::this_thread::sleep_for(20ms);
    pipe.write("alhost/\nPID=");
    std::this_thread::sleep_for(20ms);
    pipe.write("7\n");
  });
  DaemonHandoff handoff = readHandoff(pipe.readEnd(), 2s);
  writer.join();
  ASSERT_TRUE(handoff.complete());
  EXPECT_EQ(*handoff.urlLine, "URL=http://localhost/");
  EXPECT_EQ(*handoff.pidLine, "PID=7");
}

TEST(Handoff, KeepsPartialResultOnEof) {
  Pipe pipe;
  pipe.write("URL=http://127.0.0.1:3000/");
  pipe.closeWrite();
  DaemonHandoff handoff = readHandoff(pipe.readEnd(), 2s);
  EXPECT_FALSE(handoff.complete());
  ASSERT_TRUE(handoff.urlLine);
  EXPECT_EQ(*handoff.urlLine, "URL=http://127.0.0.1:3000/");
  EXPECT_FALSE(handoff.pidLine);
}

TEST(Handoff, TimesOutWhenChildStaysSilent) {
  Pipe pipe;
  auto start = std::chrono::steady_clock::now();
  DaemonHandoff handoff = readHandoff(pipe.readEnd(), 100ms);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE(handoff.urlLine);
  EXPECT_FALSE(handoff.pidLine);
  EXPECT_GE(elapsed, 90ms);
  EXPECT_LT(elapsed, 2s);
}

TEST(CurrentExecutable, PointsAtTestBinary) {
  fs::path exe = currentExecutable();
  EXPECT_TRUE(exe.is_absolute());
  EXPECT_TRUE(fs::exists(exe));
}
