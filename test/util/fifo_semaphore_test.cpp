// Copyright 2021-present StarRocks, Inc. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "util/fifo_semaphore.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "testutil/assert.h"

namespace batchgate {

class FifoSemaphoreTest : public testing::Test {
protected:
    void SetUp() override { ASSERT_OK(FifoSemaphore::create(kCapacity, &_sem)); }

    // Blocks until 'n' callers are queued on the semaphore.
    void wait_for_waiters(int64_t n) {
        while (_sem->waiting_count() < n) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    static constexpr int64_t kCapacity = 3;
    std::unique_ptr<FifoSemaphore> _sem;
};

TEST_F(FifoSemaphoreTest, create_invalid_capacity) {
    std::unique_ptr<FifoSemaphore> sem;
    Status st = FifoSemaphore::create(0, &sem);
    ASSERT_TRUE(st.is_configuration_error()) << st;
    ASSERT_TRUE(sem == nullptr);

    st = FifoSemaphore::create(-5, &sem);
    ASSERT_TRUE(st.is_configuration_error()) << st;
}

TEST_F(FifoSemaphoreTest, acquire_up_to_capacity) {
    ASSERT_EQ(kCapacity, _sem->capacity());
    ASSERT_EQ(kCapacity, _sem->available_permits());
    for (int i = 0; i < kCapacity; ++i) {
        _sem->acquire();
    }
    ASSERT_EQ(0, _sem->available_permits());
    ASSERT_EQ(0, _sem->waiting_count());
    ASSERT_FALSE(_sem->try_acquire());

    for (int i = 0; i < kCapacity; ++i) {
        _sem->release();
    }
    ASSERT_EQ(kCapacity, _sem->available_permits());
}

TEST_F(FifoSemaphoreTest, acquire_blocks_when_exhausted) {
    for (int i = 0; i < kCapacity; ++i) {
        _sem->acquire();
    }

    std::atomic<bool> acquired{false};
    std::thread t([&] {
        _sem->acquire();
        acquired = true;
    });
    wait_for_waiters(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_FALSE(acquired);

    auto status = _sem->status();
    ASSERT_EQ(0, status.available);
    ASSERT_EQ(1, status.waiting);
    ASSERT_EQ("available: 0; waiting: 1", status.debug_string());

    _sem->release();
    t.join();
    ASSERT_TRUE(acquired);
    // The released permit went straight to the waiter.
    ASSERT_EQ(0, _sem->available_permits());
    ASSERT_EQ(0, _sem->waiting_count());

    for (int i = 0; i < kCapacity; ++i) {
        _sem->release();
    }
    ASSERT_EQ(kCapacity, _sem->available_permits());
}

TEST_F(FifoSemaphoreTest, waiters_served_in_arrival_order) {
    for (int i = 0; i < kCapacity; ++i) {
        _sem->acquire();
    }

    constexpr int kWaiters = 8;
    std::mutex order_lock;
    std::vector<int> order;
    std::vector<std::thread> threads;
    for (int i = 0; i < kWaiters; ++i) {
        threads.emplace_back([&, i] {
            _sem->acquire();
            {
                std::lock_guard l(order_lock);
                order.push_back(i);
            }
            _sem->release();
        });
        // Make the arrival order deterministic.
        wait_for_waiters(i + 1);
    }

    _sem->release();
    for (auto& t : threads) {
        t.join();
    }

    ASSERT_EQ(kWaiters, static_cast<int>(order.size()));
    for (int i = 0; i < kWaiters; ++i) {
        EXPECT_EQ(i, order[i]);
    }
    ASSERT_EQ(1, _sem->available_permits());
}

TEST_F(FifoSemaphoreTest, try_acquire_does_not_overtake_waiters) {
    for (int i = 0; i < kCapacity; ++i) {
        _sem->acquire();
    }
    std::thread t([&] { _sem->acquire(); });
    wait_for_waiters(1);

    _sem->release();
    t.join();
    // The permit was handed over, nothing is left for an opportunistic caller.
    ASSERT_FALSE(_sem->try_acquire());

    _sem->release();
    ASSERT_TRUE(_sem->try_acquire());
    ASSERT_EQ(0, _sem->available_permits());
}

TEST_F(FifoSemaphoreTest, try_acquire_for_timeout) {
    for (int i = 0; i < kCapacity; ++i) {
        _sem->acquire();
    }

    ASSERT_FALSE(_sem->try_acquire_for(std::chrono::milliseconds(10)));
    // The timed out caller left the queue and consumed nothing.
    ASSERT_EQ(0, _sem->waiting_count());
    ASSERT_EQ(0, _sem->available_permits());

    _sem->release();
    ASSERT_EQ(1, _sem->available_permits());
    ASSERT_TRUE(_sem->try_acquire_for(std::chrono::milliseconds(10)));
    ASSERT_EQ(0, _sem->available_permits());
}

TEST_F(FifoSemaphoreTest, try_acquire_for_granted_while_waiting) {
    for (int i = 0; i < kCapacity; ++i) {
        _sem->acquire();
    }

    std::atomic<bool> granted{false};
    std::thread t([&] { granted = _sem->try_acquire_for(std::chrono::seconds(30)); });
    wait_for_waiters(1);
    _sem->release();
    t.join();

    ASSERT_TRUE(granted);
    ASSERT_EQ(0, _sem->available_permits());
    ASSERT_EQ(0, _sem->waiting_count());
}

TEST_F(FifoSemaphoreTest, timed_out_waiter_keeps_queue_order) {
    for (int i = 0; i < kCapacity; ++i) {
        _sem->acquire();
    }

    std::atomic<bool> first_granted{false};
    std::atomic<bool> second_granted{false};
    std::thread first([&] { first_granted = _sem->try_acquire_for(std::chrono::milliseconds(500)); });
    wait_for_waiters(1);
    std::thread second([&] {
        _sem->acquire();
        second_granted = true;
    });
    wait_for_waiters(2);

    first.join();
    ASSERT_FALSE(first_granted);
    ASSERT_EQ(1, _sem->waiting_count());

    _sem->release();
    second.join();
    ASSERT_TRUE(second_granted);
    ASSERT_EQ(0, _sem->available_permits());
}

// The semaphore trusts its callers: an unpaired release() adds a permit.
TEST_F(FifoSemaphoreTest, release_without_acquire_grows_permits) {
    _sem->release();
    ASSERT_EQ(kCapacity + 1, _sem->available_permits());
    for (int i = 0; i < kCapacity + 1; ++i) {
        ASSERT_TRUE(_sem->try_acquire());
    }
    ASSERT_FALSE(_sem->try_acquire());
}

TEST_F(FifoSemaphoreTest, guard) {
    {
        SemaphoreGuard guard(_sem.get());
        ASSERT_EQ(kCapacity - 1, _sem->available_permits());
    }
    ASSERT_EQ(kCapacity, _sem->available_permits());

    {
        SemaphoreGuard guard(_sem.get());
        guard.release();
        ASSERT_EQ(kCapacity, _sem->available_permits());
        guard.release();
        ASSERT_EQ(kCapacity, _sem->available_permits());
    }
    ASSERT_EQ(kCapacity, _sem->available_permits());
}

TEST_F(FifoSemaphoreTest, concurrent_holders_never_exceed_capacity) {
    constexpr int kThreads = 16;
    constexpr int kLoops = 200;
    std::atomic<int64_t> holders{0};
    std::atomic<int64_t> max_holders{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < kLoops; ++j) {
                SemaphoreGuard guard(_sem.get());
                int64_t now = ++holders;
                int64_t prev = max_holders.load();
                while (now > prev && !max_holders.compare_exchange_weak(prev, now)) {
                }
                --holders;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    ASSERT_LE(max_holders.load(), kCapacity);
    ASSERT_EQ(kCapacity, _sem->available_permits());
    ASSERT_EQ(0, _sem->waiting_count());
}

} // namespace batchgate
