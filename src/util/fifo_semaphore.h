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

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>

#include "common/status.h"

namespace batchgate {

struct SemaphoreStatus {
    int64_t available = 0;
    int64_t waiting = 0;

    std::string debug_string() const;
};

// A counting semaphore whose waiters are served strictly in arrival order.
//
// A released permit is handed directly to the longest-waiting caller, under the
// same lock that guards the permit counter, so no other acquire() can observe the
// permit as free while someone is queued. Every waiter sleeps on its own condition
// variable and is woken only when it is the one selected.
//
// The semaphore does not pair acquire() with release(): releasing more than was
// acquired grows available_permits() past capacity(). Callers own that pairing,
// SemaphoreGuard makes it hard to get wrong.
class FifoSemaphore {
public:
    // Returns ConfigurationError if capacity <= 0.
    static Status create(int64_t capacity, std::unique_ptr<FifoSemaphore>* sem);

    ~FifoSemaphore();

    // Takes a permit, blocking until one is handed over if none is free.
    void acquire();

    // Takes a permit only if one is free right now. Never overtakes queued waiters.
    bool try_acquire();

    // Waits at most 'timeout' for a permit.
    // Returns true if the permit was granted, the caller then owns it and must release() it.
    // Returns false if the wait timed out; in that case this caller was removed from the
    // queue atomically with the timeout decision and no permit was consumed on its behalf.
    template <typename Rep, typename Period>
    bool try_acquire_for(const std::chrono::duration<Rep, Period>& timeout) {
        return _try_acquire_until(std::chrono::steady_clock::now() +
                                  std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout));
    }

    // Gives back one permit. If someone is waiting, the permit goes to the head of the queue.
    void release();

    int64_t capacity() const { return _capacity; }

    int64_t available_permits() const;

    int64_t waiting_count() const;

    SemaphoreStatus status() const;

private:
    struct Waiter {
        std::condition_variable cv;
        bool granted = false;
    };

    explicit FifoSemaphore(int64_t capacity);

    bool _try_acquire_until(std::chrono::steady_clock::time_point deadline);

    // REQUIRES: _lock is held and _waiters is not empty.
    void _grant_head();

    FifoSemaphore(const FifoSemaphore&) = delete;
    const FifoSemaphore& operator=(const FifoSemaphore&) = delete;

    const int64_t _capacity;

    mutable std::mutex _lock;
    int64_t _available_permits;
    // Waiter objects live on the stack of the blocked thread.
    std::list<Waiter*> _waiters;
};

// Holds one permit of a FifoSemaphore for the lifetime of the guard.
class SemaphoreGuard {
public:
    explicit SemaphoreGuard(FifoSemaphore* sem) : _sem(sem) { _sem->acquire(); }

    ~SemaphoreGuard() { release(); }

    // Returns the permit before the guard goes out of scope. Idempotent.
    void release() {
        if (_sem != nullptr) {
            _sem->release();
            _sem = nullptr;
        }
    }

private:
    SemaphoreGuard(const SemaphoreGuard&) = delete;
    const SemaphoreGuard& operator=(const SemaphoreGuard&) = delete;

    FifoSemaphore* _sem;
};

} // namespace batchgate
