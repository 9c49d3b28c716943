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

#include <benchmark/benchmark.h>

#include <limits>
#include <memory>

#include "runtime/token_budget_ledger.h"
#include "testutil/assert.h"
#include "util/fifo_semaphore.h"

namespace batchgate {

// Uncontended acquire/release pair.
static void BM_semaphore_acquire_release(benchmark::State& state) {
    std::unique_ptr<FifoSemaphore> sem;
    CHECK_OK(FifoSemaphore::create(state.range(0), &sem));
    for (auto _ : state) {
        sem->acquire();
        sem->release();
    }
}
BENCHMARK(BM_semaphore_acquire_release)->Arg(1)->Arg(8);

// Every benchmark thread runs through a semaphore shared with the others, so with
// more threads than permits the FIFO hand-off path dominates.
static void BM_semaphore_contended(benchmark::State& state) {
    static std::unique_ptr<FifoSemaphore> sem;
    if (state.thread_index() == 0) {
        CHECK_OK(FifoSemaphore::create(state.range(0), &sem));
    }
    for (auto _ : state) {
        SemaphoreGuard guard(sem.get());
        benchmark::DoNotOptimize(guard);
    }
}
BENCHMARK(BM_semaphore_contended)->Arg(1)->Arg(3)->ThreadRange(1, 16)->UseRealTime();

static void BM_ledger_allocate_release(benchmark::State& state) {
    std::unique_ptr<TokenBudgetLedger> ledger;
    CHECK_OK(TokenBudgetLedger::create(std::numeric_limits<int64_t>::max(), &ledger));
    int64_t batch_id = 0;
    for (auto _ : state) {
        bool ok = ledger->allocate_for_batch(batch_id, 1);
        benchmark::DoNotOptimize(ok);
        ledger->release_batch(batch_id);
        ++batch_id;
    }
}
BENCHMARK(BM_ledger_allocate_release);

} // namespace batchgate

BENCHMARK_MAIN();
