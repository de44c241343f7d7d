// Copyright 2025 KVCache.AI
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "geoload/common/thread_pool.h"

#include <gtest/gtest.h>
#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include "geoload/common/cancellation.h"

namespace geoload {

TEST(ThreadPoolTest, FuturesCarryResults) {
    ThreadPool pool(4);
    EXPECT_EQ(pool.size(), 4u);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 32; ++i) {
        futures.push_back(pool.enqueue([i] { return i * i; }));
    }
    int sum = 0;
    for (auto& future : futures) sum += future.get();
    EXPECT_EQ(sum, 10416);
}

TEST(ThreadPoolTest, StopDrainsQueuedTasks) {
    std::atomic<int> done{0};
    ThreadPool pool(1);
    for (int i = 0; i < 10; ++i) {
        pool.enqueue([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++done;
        });
    }
    pool.stop();
    EXPECT_EQ(done.load(), 10);
    EXPECT_THROW(pool.enqueue([] {}), std::runtime_error);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(2);
    auto future = pool.enqueue([]() -> int { throw std::logic_error("boom"); });
    EXPECT_THROW(future.get(), std::logic_error);
}

TEST(CancellationTest, TokensShareTheSourceFlag) {
    CancellationToken detached;
    EXPECT_FALSE(detached.stopRequested());

    CancellationSource source;
    CancellationToken token = source.token();
    CancellationSource copy = source;
    EXPECT_FALSE(token.stopRequested());
    copy.requestStop();
    EXPECT_TRUE(source.stopRequested());
    EXPECT_TRUE(token.stopRequested());
}

TEST(CancellationTest, InterruptWatcherTurnsSignalIntoStop) {
    google::InitGoogleLogging("CancellationTest");
    FLAGS_logtostderr = 1;
    CancellationSource source;
    {
        InterruptWatcher watcher(source);
        ASSERT_EQ(kill(getpid(), SIGINT), 0);
        for (int i = 0; i < 500 && !source.stopRequested(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    EXPECT_TRUE(source.stopRequested());
    google::ShutdownGoogleLogging();
}

}  // namespace geoload
