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

#include <fmt/format.h>

#include "common/compiler_util.h"
#include "common/logging.h"

namespace batchgate {

std::string SemaphoreStatus::debug_string() const {
    return fmt::format("available: {}; waiting: {}", available, waiting);
}

Status FifoSemaphore::create(int64_t capacity, std::unique_ptr<FifoSemaphore>* sem) {
    if (capacity <= 0) {
        return Status::ConfigurationError(
                fmt::format("semaphore capacity must be greater than 0, capacity={}", capacity));
    }
    sem->reset(new FifoSemaphore(capacity));
    return Status::OK();
}

FifoSemaphore::FifoSemaphore(int64_t capacity) : _capacity(capacity), _available_permits(capacity) {
    VLOG_ADMISSION << "semaphore created with " << capacity << " permits";
}

FifoSemaphore::~FifoSemaphore() {
    std::lock_guard l(_lock);
    DCHECK(_waiters.empty()) << "semaphore destroyed with " << _waiters.size() << " waiters";
}

void FifoSemaphore::acquire() {
    std::unique_lock l(_lock);
    if (_available_permits > 0) {
        --_available_permits;
        VLOG_ADMISSION << "semaphore permit acquired, " << _available_permits << " remaining";
        return;
    }

    VLOG_ADMISSION << "semaphore permit requested, waiting in queue (" << _waiters.size() << " waiting)";
    Waiter waiter;
    _waiters.push_back(&waiter);
    waiter.cv.wait(l, [&waiter] { return waiter.granted; });
}

bool FifoSemaphore::try_acquire() {
    std::lock_guard l(_lock);
    if (_available_permits > 0) {
        DCHECK(_waiters.empty());
        --_available_permits;
        VLOG_ADMISSION << "semaphore permit acquired, " << _available_permits << " remaining";
        return true;
    }
    return false;
}

bool FifoSemaphore::_try_acquire_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock l(_lock);
    if (_available_permits > 0) {
        --_available_permits;
        VLOG_ADMISSION << "semaphore permit acquired, " << _available_permits << " remaining";
        return true;
    }

    Waiter waiter;
    auto it = _waiters.insert(_waiters.end(), &waiter);
    if (waiter.cv.wait_until(l, deadline, [&waiter] { return waiter.granted; })) {
        return true;
    }
    // Timed out and not granted. release() only grants while holding _lock and removes
    // the waiter from the queue when it does, so we are still queued here.
    _waiters.erase(it);
    VLOG_ADMISSION << "semaphore wait timed out, " << _waiters.size() << " still waiting";
    return false;
}

void FifoSemaphore::release() {
    std::lock_guard l(_lock);
    ++_available_permits;
    VLOG_ADMISSION << "semaphore permit released, " << _available_permits << " available";
    if (!_waiters.empty()) {
        _grant_head();
    } else if (UNLIKELY(_available_permits > _capacity)) {
        LOG(WARNING) << "semaphore released more times than acquired, available=" << _available_permits
                     << " capacity=" << _capacity;
    }
}

void FifoSemaphore::_grant_head() {
    Waiter* head = _waiters.front();
    _waiters.pop_front();
    --_available_permits;
    head->granted = true;
    // Notify under the lock: the waiter owns 'head' and may return as soon as it sees 'granted'.
    head->cv.notify_one();
    VLOG_ADMISSION << "semaphore permit granted to waiting caller, " << _available_permits << " remaining";
}

int64_t FifoSemaphore::available_permits() const {
    std::lock_guard l(_lock);
    return _available_permits;
}

int64_t FifoSemaphore::waiting_count() const {
    std::lock_guard l(_lock);
    return static_cast<int64_t>(_waiters.size());
}

SemaphoreStatus FifoSemaphore::status() const {
    std::lock_guard l(_lock);
    return {_available_permits, static_cast<int64_t>(_waiters.size())};
}

} // namespace batchgate
