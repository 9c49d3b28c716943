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

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "common/compiler_util.h"
#include "common/logging.h"
#include "common/status.h"

namespace batchgate {

// Snapshot of a TokenBudgetLedger, for monitoring only.
struct BudgetStatus {
    int64_t total = 0;
    int64_t used = 0;
    int64_t reserved = 0;
    int64_t available = 0;
    int64_t active_batches = 0;
    // (used + reserved) / total * 100, rounded to two decimals.
    double utilization_percent = 0;

    std::string debug_string() const;
};

// Two-phase accounting of a shared token budget across concurrently running batches.
//
// allocate_for_batch() reserves the estimated cost of a batch before it starts,
// release_batch() commits that same estimate into the used tokens when the batch
// finishes, whether it succeeded or not. The ledger never reconciles the estimate
// against the real cost.
//
// After every call used + reserved <= total, unless update_budget() shrank the total
// below what is already committed; then nothing new is admitted until releases and
// reset() bring it back.
//
// Misuse at runtime (non-positive estimate, double allocation, releasing an unknown
// batch) is reported by the return value or a warning log and leaves the state unchanged.
// A batch that never calls release_batch() keeps its reservation forever.
class TokenBudgetLedger {
public:
    // Returns ConfigurationError if total_budget <= 0.
    static Status create(int64_t total_budget, std::unique_ptr<TokenBudgetLedger>* ledger);

    ~TokenBudgetLedger() = default;

    // Reserves 'estimated_tokens' for 'batch_id'.
    // Returns false, without any state change, if the estimate is not positive,
    // if 'batch_id' already holds a reservation, or if the budget can not cover it.
    WARN_UNUSED_RESULT
    bool allocate_for_batch(int64_t batch_id, int64_t estimated_tokens);

    // Commits the reservation of 'batch_id' into the used tokens and forgets it.
    // No-op with a warning if 'batch_id' holds no reservation.
    void release_batch(int64_t batch_id);

    // total - used - reserved
    int64_t available_budget() const;

    int64_t total_budget() const;
    int64_t used_tokens() const;
    int64_t reserved_tokens() const;
    int64_t active_batches() const;

    BudgetStatus budget_status() const;

    // Changes the total at runtime. Returns ConfigurationError if new_total <= 0.
    // Shrinking below the committed tokens is allowed and only logged, in-flight
    // reservations are kept.
    Status update_budget(int64_t new_total);

    // Forgets every reservation and the used tokens. The total is kept.
    void reset();

private:
    explicit TokenBudgetLedger(int64_t total_budget);

    int64_t _available_budget_locked() const { return _total_budget - _used_tokens - _reserved_tokens; }

    TokenBudgetLedger(const TokenBudgetLedger&) = delete;
    const TokenBudgetLedger& operator=(const TokenBudgetLedger&) = delete;

    mutable std::mutex _lock;
    int64_t _total_budget;
    int64_t _used_tokens = 0;
    int64_t _reserved_tokens = 0;
    // batch id -> reserved tokens, one entry per outstanding reservation
    std::unordered_map<int64_t, int64_t> _allocations;
};

// Holds one reservation of a TokenBudgetLedger and releases it when destroyed.
class TokenReservationGuard {
public:
    TokenReservationGuard() = default;

    ~TokenReservationGuard() { release(); }

    // Returns the result of allocate_for_batch(). The guard only owns the
    // reservation when this returns true.
    bool reserve(TokenBudgetLedger* ledger, int64_t batch_id, int64_t estimated_tokens) {
        DCHECK(_ledger == nullptr) << "guard already holds batch " << _batch_id;
        if (ledger->allocate_for_batch(batch_id, estimated_tokens)) {
            _ledger = ledger;
            _batch_id = batch_id;
            return true;
        }
        return false;
    }

    void release() {
        if (_ledger != nullptr) {
            _ledger->release_batch(_batch_id);
            _ledger = nullptr;
        }
    }

    bool owns_reservation() const { return _ledger != nullptr; }

private:
    TokenReservationGuard(const TokenReservationGuard&) = delete;
    const TokenReservationGuard& operator=(const TokenReservationGuard&) = delete;

    TokenBudgetLedger* _ledger = nullptr;
    int64_t _batch_id = -1;
};

} // namespace batchgate
