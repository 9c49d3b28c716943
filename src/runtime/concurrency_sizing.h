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

namespace batchgate {

// Picks how many batches to run in parallel before a run starts:
//   max(1, min(max_concurrent, total_jobs, floor(total_budget / avg_cost_per_job)))
// The result is never 0, a tight budget degrades to one batch at a time.
// avg_cost_per_job == 0 skips the budget ceiling. A negative cost or budget
// gives a non-positive ceiling and therefore 1.
int64_t calculate_optimal_concurrency(int64_t total_jobs, int64_t max_concurrent, int64_t avg_cost_per_job,
                                      int64_t total_budget);

// Same as above with config::batch_max_concurrent as the ceiling.
int64_t calculate_optimal_concurrency(int64_t total_jobs, int64_t avg_cost_per_job, int64_t total_budget);

} // namespace batchgate
