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

#include "runtime/concurrency_sizing.h"

#include <algorithm>
#include <limits>

#include "common/config.h"
#include "common/logging.h"

namespace batchgate {

int64_t calculate_optimal_concurrency(int64_t total_jobs, int64_t max_concurrent, int64_t avg_cost_per_job,
                                      int64_t total_budget) {
    int64_t optimal = std::min(max_concurrent, total_jobs);

    // A zero cost puts no bound on the budget side.
    int64_t budget_limit = std::numeric_limits<int64_t>::max();
    if (avg_cost_per_job != 0) {
        // Truncation only differs from floor for a negative quotient, which the
        // max(1, ...) below clamps either way.
        budget_limit = total_budget / avg_cost_per_job;
    }
    optimal = std::min(optimal, budget_limit);

    optimal = std::max<int64_t>(1, optimal);

    VLOG_ADMISSION << "calculated optimal concurrency: " << optimal << " (max: " << max_concurrent
                   << ", batches: " << total_jobs << ", token-limited: " << budget_limit << ")";
    return optimal;
}

int64_t calculate_optimal_concurrency(int64_t total_jobs, int64_t avg_cost_per_job, int64_t total_budget) {
    return calculate_optimal_concurrency(total_jobs, config::batch_max_concurrent, avg_cost_per_job, total_budget);
}

} // namespace batchgate
