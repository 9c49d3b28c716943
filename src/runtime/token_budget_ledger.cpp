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

#include "runtime/token_budget_ledger.h"

#include <fmt/format.h>

#include <cmath>

#include "common/logging.h"

namespace batchgate {

std::string BudgetStatus::debug_string() const {
    return fmt::format("total: {}; used: {}; reserved: {}; available: {}; active batches: {}; utilization: {:.2f}%",
                       total, used, reserved, available, active_batches, utilization_percent);
}

Status TokenBudgetLedger::create(int64_t total_budget, std::unique_ptr<TokenBudgetLedger>* ledger) {
    if (total_budget <= 0) {
        return Status::ConfigurationError(
                fmt::format("token budget must be greater than 0, total_budget={}", total_budget));
    }
    ledger->reset(new TokenBudgetLedger(total_budget));
    return Status::OK();
}

TokenBudgetLedger::TokenBudgetLedger(int64_t total_budget) : _total_budget(total_budget) {
    VLOG_BUDGET << "token budget ledger created with budget of " << total_budget << " tokens";
}

bool TokenBudgetLedger::allocate_for_batch(int64_t batch_id, int64_t estimated_tokens) {
    if (estimated_tokens <= 0) {
        LOG(WARNING) << "invalid token estimate for batch " << batch_id << ": " << estimated_tokens;
        return false;
    }

    std::lock_guard l(_lock);
    if (_allocations.count(batch_id) > 0) {
        LOG(WARNING) << "batch " << batch_id << " already has token allocation";
        return false;
    }

    // Same as used + reserved + estimate > total, without the overflow.
    if (estimated_tokens > _available_budget_locked()) {
        VLOG_BUDGET << "insufficient token budget for batch " << batch_id << ": need " << estimated_tokens
                    << ", available " << _available_budget_locked();
        return false;
    }

    _reserved_tokens += estimated_tokens;
    _allocations.emplace(batch_id, estimated_tokens);
    DCHECK_LE(_used_tokens + _reserved_tokens, _total_budget);

    VLOG_BUDGET << "allocated " << estimated_tokens << " tokens for batch " << batch_id << " ("
                << _available_budget_locked() << " remaining)";
    return true;
}

void TokenBudgetLedger::release_batch(int64_t batch_id) {
    std::lock_guard l(_lock);
    auto it = _allocations.find(batch_id);
    if (it == _allocations.end()) {
        LOG(WARNING) << "no token allocation found for batch " << batch_id;
        return;
    }

    const int64_t allocated = it->second;
    _reserved_tokens -= allocated;
    _used_tokens += allocated;
    _allocations.erase(it);
    DCHECK_GE(_reserved_tokens, 0);

    VLOG_BUDGET << "released " << allocated << " tokens from batch " << batch_id << " ("
                << _available_budget_locked() << " now available)";
}

int64_t TokenBudgetLedger::available_budget() const {
    std::lock_guard l(_lock);
    return _available_budget_locked();
}

int64_t TokenBudgetLedger::total_budget() const {
    std::lock_guard l(_lock);
    return _total_budget;
}

int64_t TokenBudgetLedger::used_tokens() const {
    std::lock_guard l(_lock);
    return _used_tokens;
}

int64_t TokenBudgetLedger::reserved_tokens() const {
    std::lock_guard l(_lock);
    return _reserved_tokens;
}

int64_t TokenBudgetLedger::active_batches() const {
    std::lock_guard l(_lock);
    return static_cast<int64_t>(_allocations.size());
}

BudgetStatus TokenBudgetLedger::budget_status() const {
    std::lock_guard l(_lock);
    BudgetStatus status;
    status.total = _total_budget;
    status.used = _used_tokens;
    status.reserved = _reserved_tokens;
    status.available = _available_budget_locked();
    status.active_batches = static_cast<int64_t>(_allocations.size());
    double utilization = static_cast<double>(_used_tokens + _reserved_tokens) / _total_budget * 100;
    status.utilization_percent = std::round(utilization * 100) / 100;
    return status;
}

Status TokenBudgetLedger::update_budget(int64_t new_total) {
    if (new_total <= 0) {
        return Status::ConfigurationError(
                fmt::format("token budget must be greater than 0, new_total={}", new_total));
    }

    std::lock_guard l(_lock);
    const int64_t old_total = _total_budget;
    _total_budget = new_total;
    VLOG_BUDGET << "token budget updated from " << old_total << " to " << new_total;

    if (new_total < _used_tokens + _reserved_tokens) {
        LOG(WARNING) << "new token budget (" << new_total << ") is less than current usage ("
                     << _used_tokens + _reserved_tokens << ")";
    }
    return Status::OK();
}

void TokenBudgetLedger::reset() {
    std::lock_guard l(_lock);
    _used_tokens = 0;
    _reserved_tokens = 0;
    _allocations.clear();
    VLOG_BUDGET << "token budget ledger reset";
}

} // namespace batchgate
