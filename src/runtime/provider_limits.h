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
#include <string>
#include <string_view>
#include <vector>

#include "common/status.h"

namespace batchgate {

// Token ceilings of the inference providers a batch may be sent to.
//
// Provider names are matched case-insensitively: an exact name first, then the
// first known name (in table order) that contains the given one or is contained
// in it, e.g. "anthropic-claude-3" resolves to "anthropic". Anything else falls
// back to the "auto" limit.

// Advertised limit, or the slightly lower conservative one.
int64_t get_provider_token_limit(std::string_view provider, bool conservative = false);

// Clamps a configured max-tokens value to the provider limit.
// A non-positive 'configured_tokens' means unset and yields the provider limit.
int64_t validate_provider_token_limit(std::string_view provider, int64_t configured_tokens,
                                      bool conservative = false);

bool is_provider_supported(std::string_view provider);

std::vector<std::string> supported_providers();

// What one planned batch may spend.
struct ProviderQuota {
    std::string provider;
    // <= 0 means use the provider limit.
    int64_t max_tokens = 0;
};

// Derives the total budget for a TokenBudgetLedger from the batches of a run:
//   floor(quotas.size() * min(per batch limit) * config::batch_budget_safety_ratio)
// Per batch limit is 'max_tokens' when set, else the provider limit (conservative when
// config::batch_use_conservative_provider_limits).
// Returns InvalidArgument on empty 'quotas' or a safety ratio outside (0, 1].
Status calculate_total_token_budget(const std::vector<ProviderQuota>& quotas, int64_t* total_budget);

} // namespace batchgate
