#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "docsage_core/async/cancellation_token.hpp"
#include "docsage_core/async/worker_pool.hpp"
#include "docsage_core/errors.hpp"

namespace docsage_core::async {

TEST(WorkerPoolTest, ConstructorThrowsOnZeroThreads) {
  EXPECT_THROW({ WorkerPool pool(0); }, std::invalid_argument);
}

TEST(WorkerPoolTest, ConstructAndDestroyWithoutJobs) {
  EXPECT_NO_THROW({
    WorkerPool pool(2);
    EXPECT_EQ(pool.size(), 2u);
  });
}

TEST(WorkerPoolTest, RunsEverySubmittedJob) {
  WorkerPool pool(3);
  std::vector<std::promise<int>> promises(20);
  std::vector<std::future<int>> futures;
  for (auto &promise : promises) {
    futures.push_back(promise.get_future());
  }

  for (int i = 0; i < 20; ++i) {
    pool.submit([&promises, i]() { promises[i].set_value(i * i); });
  }

  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(futures[i].get(), i * i);
  }
}

TEST(WorkerPoolTest, NeverExceedsThreadCount) {
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::atomic<int> finished{0};
  {
    WorkerPool pool(2);
    for (int i = 0; i < 8; ++i) {
      pool.submit([&]() {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        --running;
        ++finished;
      });
    }
    while (finished.load() < 8) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }
  EXPECT_LE(peak.load(), 2);
}

TEST(WorkerPoolTest, WorkerSurvivesThrowingJob) {
  WorkerPool pool(1);
  pool.submit([]() { throw std::runtime_error("boom"); });

  std::promise<void> done;
  auto future = done.get_future();
  pool.submit([&done]() { done.set_value(); });

  EXPECT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

TEST(CancellationTokenTest, ThrowsOnlyOnceCancelled) {
  CancellationToken token;
  EXPECT_FALSE(token.is_cancelled());
  EXPECT_NO_THROW(token.throw_if_cancelled("work"));

  token.cancel();
  EXPECT_TRUE(token.is_cancelled());
  try {
    token.throw_if_cancelled("Index build");
    FAIL() << "Expected CancelledError";
  } catch (const CancelledError &e) {
    EXPECT_STREQ(e.what(), "Index build cancelled");
  }
}

}  // namespace docsage_core::async
