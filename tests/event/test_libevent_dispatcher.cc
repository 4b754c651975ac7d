#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "canal/event/event_loop.h"
#include "canal/event/libevent_dispatcher.h"
#include "canal/event/worker.h"

using namespace canal::event;
using namespace std::chrono_literals;

namespace {

/**
 * Dispatcher tests against a real event base running on a worker thread.
 */
class LibeventDispatcherTest : public ::testing::Test {
 protected:
  LibeventDispatcherTest()
      : worker_(createLibeventDispatcher("dispatcher_test")) {}

  void SetUp() override { worker_.start(); }

  void TearDown() override {
    runInDispatcher([this]() {
      file_events_.clear();
      timers_.clear();
    });
    worker_.stop();
    for (int fd : fds_) {
      ::close(fd);
    }
  }

  Dispatcher& dispatcher() { return worker_.dispatcher(); }

  // Run on the loop thread and wait for the result
  template <typename F>
  auto runInDispatcher(F&& func) -> decltype(func()) {
    std::packaged_task<decltype(func())()> task(std::forward<F>(func));
    auto future = task.get_future();
    dispatcher().post([&task]() { task(); });
    return future.get();
  }

  bool waitFor(std::function<bool()> condition) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
      if (condition()) {
        return true;
      }
      std::this_thread::sleep_for(2ms);
    }
    return condition();
  }

  std::pair<int, int> socketPair() {
    int fds[2];
    EXPECT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds));
    fds_.push_back(fds[0]);
    fds_.push_back(fds[1]);
    return {fds[0], fds[1]};
  }

  Worker worker_;
  std::vector<int> fds_;
  std::vector<FileEventPtr> file_events_;
  std::vector<TimerPtr> timers_;
};

class CountingDeletable : public DeferredDeletable {
 public:
  explicit CountingDeletable(std::atomic<int>& deleted) : deleted_(deleted) {}
  ~CountingDeletable() override { ++deleted_; }

 private:
  std::atomic<int>& deleted_;
};

TEST_F(LibeventDispatcherTest, KnowsItsLoopThread) {
  EXPECT_EQ("dispatcher_test", dispatcher().name());
  EXPECT_TRUE(runInDispatcher([this]() { return worker_.onWorkerThread(); }));
  EXPECT_FALSE(dispatcher().isThreadSafe());
}

TEST_F(LibeventDispatcherTest, PostedCallbacksRunInOrder) {
  std::vector<int> order;
  std::atomic<int> done{0};

  for (int i = 0; i < 5; ++i) {
    dispatcher().post([&, i]() {
      order.push_back(i);
      ++done;
    });
  }

  ASSERT_TRUE(waitFor([&]() { return done == 5; }));
  EXPECT_EQ((std::vector<int>{0, 1, 2, 3, 4}), order);
}

TEST_F(LibeventDispatcherTest, PostFromManyThreads) {
  std::atomic<int> count{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 100; ++i) {
        dispatcher().post([&]() { ++count; });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_TRUE(waitFor([&]() { return count == 400; }));
}

TEST_F(LibeventDispatcherTest, FileEventReportsReadable) {
  auto fds = socketPair();

  std::atomic<uint32_t> seen{0};
  runInDispatcher([&]() {
    file_events_.push_back(dispatcher().createFileEvent(
        fds.first, [&](uint32_t events) { seen |= events; },
        static_cast<uint32_t>(FileReadyType::Read)));
  });

  ASSERT_EQ(1, ::write(fds.second, "x", 1));
  EXPECT_TRUE(waitFor([&]() {
    return (seen & static_cast<uint32_t>(FileReadyType::Read)) != 0;
  }));
}

TEST_F(LibeventDispatcherTest, FileEventReportsWritable) {
  auto fds = socketPair();

  std::atomic<bool> writable{false};
  runInDispatcher([&]() {
    file_events_.push_back(dispatcher().createFileEvent(
        fds.first,
        [&](uint32_t events) {
          if (events & static_cast<uint32_t>(FileReadyType::Write)) {
            writable = true;
          }
        },
        FileReadyType::Read | FileReadyType::Write));
  });

  EXPECT_TRUE(waitFor([&]() { return writable.load(); }));
}

TEST_F(LibeventDispatcherTest, ReportsEachArrivalOnce) {
  auto fds = socketPair();

  std::atomic<int> fired{0};
  runInDispatcher([&]() {
    file_events_.push_back(dispatcher().createFileEvent(
        fds.first, [&](uint32_t) { ++fired; },
        static_cast<uint32_t>(FileReadyType::Read)));
  });

  ASSERT_EQ(1, ::write(fds.second, "x", 1));
  ASSERT_TRUE(waitFor([&]() { return fired >= 1; }));
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(1, fired.load());

  ASSERT_EQ(1, ::write(fds.second, "y", 1));
  EXPECT_TRUE(waitFor([&]() { return fired == 2; }));
}

TEST_F(LibeventDispatcherTest, DisabledFileEventStaysQuiet) {
  auto fds = socketPair();

  std::atomic<int> fired{0};
  runInDispatcher([&]() {
    file_events_.push_back(dispatcher().createFileEvent(
        fds.first, [&](uint32_t) { ++fired; },
        static_cast<uint32_t>(FileReadyType::Read)));
    file_events_.back()->setEnabled(0);
  });

  ASSERT_EQ(1, ::write(fds.second, "x", 1));
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(0, fired.load());
}

TEST_F(LibeventDispatcherTest, TimerFiresOnce) {
  std::atomic<int> fired{0};
  runInDispatcher([&]() {
    timers_.push_back(dispatcher().createTimer([&]() { ++fired; }));
    timers_.back()->enableTimer(10ms);
    EXPECT_TRUE(timers_.back()->enabled());
  });

  ASSERT_TRUE(waitFor([&]() { return fired == 1; }));
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(1, fired.load());
  EXPECT_FALSE(
      runInDispatcher([this]() { return timers_.back()->enabled(); }));
}

TEST_F(LibeventDispatcherTest, DisabledTimerDoesNotFire) {
  std::atomic<int> fired{0};
  runInDispatcher([&]() {
    timers_.push_back(dispatcher().createTimer([&]() { ++fired; }));
    timers_.back()->enableTimer(20ms);
    timers_.back()->disableTimer();
  });

  std::this_thread::sleep_for(80ms);
  EXPECT_EQ(0, fired.load());
}

TEST_F(LibeventDispatcherTest, TimerCanRearmFromItsCallback) {
  std::atomic<int> fired{0};
  runInDispatcher([&]() {
    timers_.push_back(dispatcher().createTimer([&]() {
      if (++fired < 3) {
        timers_.front()->enableTimer(5ms);
      }
    }));
    timers_.front()->enableTimer(5ms);
  });

  EXPECT_TRUE(waitFor([&]() { return fired == 3; }));
}

TEST_F(LibeventDispatcherTest, DeferredDeleteHappensAfterCurrentCallback) {
  std::atomic<int> deleted{0};
  int deleted_inside = -1;

  runInDispatcher([&]() {
    dispatcher().deferredDelete(std::make_unique<CountingDeletable>(deleted));
    deleted_inside = deleted.load();
  });

  EXPECT_EQ(0, deleted_inside);
  EXPECT_TRUE(waitFor([&]() { return deleted == 1; }));
}

TEST_F(LibeventDispatcherTest, ClearDeferredDeleteListDestroysAtOnce) {
  std::atomic<int> deleted{0};
  int deleted_after_clear = -1;

  runInDispatcher([&]() {
    dispatcher().deferredDelete(std::make_unique<CountingDeletable>(deleted));
    dispatcher().clearDeferredDeleteList();
    deleted_after_clear = deleted.load();
  });

  EXPECT_EQ(1, deleted_after_clear);
}

TEST(LibeventDispatcherLifecycleTest, ExitStopsRunFromAnotherThread) {
  auto dispatcher = createLibeventDispatcher("exit_test");

  std::atomic<bool> returned{false};
  std::thread loop([&]() {
    dispatcher->run();
    returned = true;
  });

  std::this_thread::sleep_for(20ms);
  dispatcher->exit();
  loop.join();
  EXPECT_TRUE(returned.load());
}

TEST(LibeventDispatcherLifecycleTest, RunDrainsCallbacksQueuedBehindExit) {
  auto dispatcher = createLibeventDispatcher("drain_test");

  int runs = 0;
  dispatcher->post([&]() { dispatcher->exit(); });
  dispatcher->post([&]() { ++runs; });
  dispatcher->run();
  EXPECT_EQ(1, runs);
}

TEST(WorkerTest, StopRunsQueuedCallbacksFirst) {
  Worker worker(createLibeventDispatcher("worker_test"));
  worker.start();
  EXPECT_TRUE(worker.isRunning());

  std::atomic<int> runs{0};
  for (int i = 0; i < 10; ++i) {
    worker.dispatcher().post([&]() { ++runs; });
  }
  worker.stop();

  EXPECT_FALSE(worker.isRunning());
  EXPECT_EQ(10, runs.load());
}

TEST(WorkerTest, StopFromOwnThreadLeavesJoinToDestructor) {
  std::promise<bool> stopped;
  {
    Worker worker(createLibeventDispatcher("self_stop"));
    worker.start();
    worker.dispatcher().post([&]() {
      worker.stop();
      stopped.set_value(worker.isRunning());
    });
    auto future = stopped.get_future();
    ASSERT_EQ(std::future_status::ready, future.wait_for(5s));
    EXPECT_FALSE(future.get());
  }
}

TEST(WorkerTest, RestartsAfterStop) {
  Worker worker(createLibeventDispatcher("restart"));
  worker.start();
  worker.stop();
  worker.start();

  std::promise<bool> ran;
  worker.dispatcher().post([&]() { ran.set_value(worker.onWorkerThread()); });
  auto future = ran.get_future();
  ASSERT_EQ(std::future_status::ready, future.wait_for(5s));
  EXPECT_TRUE(future.get());
  worker.stop();
}

}  // namespace
