/**
 * @file test_libevent_dispatcher.cc
 * @brief Real-I/O tests for the libevent dispatcher
 */

#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "deepresearch/event/libevent_dispatcher.h"

namespace deepresearch {
namespace event {
namespace {

class LibeventDispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ = std::make_unique<LibeventDispatcher>("test");
    // Guard against a hung loop failing the whole suite
    guard_ = dispatcher_->createTimer([this]() {
      timed_out_ = true;
      dispatcher_->exit();
    });
    guard_->enableTimer(std::chrono::milliseconds(5000));
  }

  void TearDown() override {
    guard_.reset();
    dispatcher_.reset();
  }

  std::unique_ptr<LibeventDispatcher> dispatcher_;
  TimerPtr guard_;
  bool timed_out_{false};
};

TEST_F(LibeventDispatcherTest, AvoidsEpoll) {
  EXPECT_NE(dispatcher_->backend(), "epoll");
  EXPECT_FALSE(dispatcher_->backend().empty());
  EXPECT_EQ(dispatcher_->name(), "test");
}

TEST_F(LibeventDispatcherTest, PostRunsOnLoopThread) {
  std::thread::id callback_thread;
  bool thread_safe = false;

  dispatcher_->post([&]() {
    callback_thread = std::this_thread::get_id();
    thread_safe = dispatcher_->isThreadSafe();
    dispatcher_->exit();
  });
  dispatcher_->run(RunType::Block);

  EXPECT_EQ(callback_thread, std::this_thread::get_id());
  EXPECT_TRUE(thread_safe);
  EXPECT_FALSE(timed_out_);
}

TEST_F(LibeventDispatcherTest, PostFromAnotherThreadWakesLoop) {
  std::atomic<int> count{0};

  std::thread poster([this, &count]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    dispatcher_->post([this, &count]() {
      ++count;
      dispatcher_->exit();
    });
  });

  dispatcher_->run(RunType::Block);
  poster.join();

  EXPECT_EQ(count.load(), 1);
  EXPECT_FALSE(timed_out_);
}

TEST_F(LibeventDispatcherTest, ExitFromAnotherThread) {
  std::thread stopper([this]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    dispatcher_->exit();
  });

  dispatcher_->run(RunType::Block);
  stopper.join();
  EXPECT_FALSE(timed_out_);
}

TEST_F(LibeventDispatcherTest, ExitBeforeRunReturnsImmediately) {
  dispatcher_->exit();
  dispatcher_->run(RunType::Block);
  EXPECT_FALSE(timed_out_);
}

TEST_F(LibeventDispatcherTest, TimerFiresOnce) {
  int fired = 0;
  auto timer = dispatcher_->createTimer([&]() {
    ++fired;
    dispatcher_->exit();
  });
  timer->enableTimer(std::chrono::milliseconds(10));
  EXPECT_TRUE(timer->enabled());

  dispatcher_->run(RunType::Block);

  EXPECT_EQ(fired, 1);
  EXPECT_FALSE(timer->enabled());
}

TEST_F(LibeventDispatcherTest, DisabledTimerDoesNotFire) {
  bool fired = false;
  auto timer = dispatcher_->createTimer([&]() { fired = true; });
  timer->enableTimer(std::chrono::milliseconds(10));
  timer->disableTimer();

  auto stop = dispatcher_->createTimer([this]() { dispatcher_->exit(); });
  stop->enableTimer(std::chrono::milliseconds(50));
  dispatcher_->run(RunType::Block);

  EXPECT_FALSE(fired);
}

TEST_F(LibeventDispatcherTest, FileEventReportsReadable) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);

  uint32_t seen = 0;
  auto file_event = dispatcher_->createFileEvent(
      fds[0],
      [&](uint32_t events) {
        seen = events;
        char buf[16];
        ASSERT_GT(read(fds[0], buf, sizeof(buf)), 0);
        dispatcher_->exit();
      },
      static_cast<uint32_t>(FileReadyType::Read));

  ASSERT_EQ(write(fds[1], "x", 1), 1);
  dispatcher_->run(RunType::Block);

  EXPECT_TRUE(FileReadyType::Read & seen);
  EXPECT_FALSE(timed_out_);

  file_event.reset();
  close(fds[0]);
  close(fds[1]);
}

TEST_F(LibeventDispatcherTest, FileEventCanBeDisabledFromItsCallback) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);

  int calls = 0;
  FileEventPtr file_event;
  file_event = dispatcher_->createFileEvent(
      fds[0],
      [&](uint32_t) {
        ++calls;
        file_event->setEnabled(0);
      },
      static_cast<uint32_t>(FileReadyType::Read));

  // Level-triggered: left unread, the pipe would fire on every iteration
  ASSERT_EQ(write(fds[1], "x", 1), 1);
  auto stop = dispatcher_->createTimer([this]() { dispatcher_->exit(); });
  stop->enableTimer(std::chrono::milliseconds(50));
  dispatcher_->run(RunType::Block);

  EXPECT_EQ(calls, 1);

  file_event.reset();
  close(fds[0]);
  close(fds[1]);
}

TEST_F(LibeventDispatcherTest, NonBlockRunReturns) {
  bool ran = false;
  dispatcher_->post([&]() { ran = true; });
  dispatcher_->run(RunType::NonBlock);
  EXPECT_TRUE(ran);
}

TEST_F(LibeventDispatcherTest, RegularFileIsWatchable) {
  char path[] = "/tmp/deepresearch_dispatcher_XXXXXX";
  int fd = mkstemp(path);
  ASSERT_GE(fd, 0);
  unlink(path);

  bool readable = false;
  FileEventPtr file_event;
  EXPECT_NO_THROW(file_event = dispatcher_->createFileEvent(
                      fd,
                      [&](uint32_t) {
                        readable = true;
                        dispatcher_->exit();
                      },
                      static_cast<uint32_t>(FileReadyType::Read)));
  dispatcher_->run(RunType::Block);

  EXPECT_TRUE(readable);
  file_event.reset();
  close(fd);
}

}  // namespace
}  // namespace event
}  // namespace deepresearch
