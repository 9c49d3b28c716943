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

#include "runtime/provider_limits.h"

#include <fmt/format.h>

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <cmath>
#include <iterator>
#include <limits>

#include "common/config.h"
#include "common/logging.h"

namespace batchgate {

namespace {

struct ProviderLimit {
    const char* name;
    int64_t standard;
    int64_t conservative;
};

// Order matters for partial matches.
const ProviderLimit kProviderLimits[] = {
        // Vertex AI limit is 65537 exclusive
        {"vertex", 65536, 65536},
        {"google-ai", 65536, 65536},
        {"gemini", 65536, 65536},
        {"openai", 128000, 120000},
        {"gpt-4", 128000, 120000},
        {"anthropic", 200000, 190000},
        {"claude", 200000, 190000},
        {"azure", 128000, 120000},
        {"bedrock", 100000, 95000},
        {"auto", 60000, 60000},
};

const ProviderLimit& auto_limit() {
    return kProviderLimits[std::size(kProviderLimits) - 1];
}

int64_t pick(const ProviderLimit& limit, bool conservative) {
    return conservative ? limit.conservative : limit.standard;
}

// nullptr if nothing matches.
const ProviderLimit* find_provider(std::string_view provider) {
    if (provider.empty()) {
        return nullptr;
    }
    std::string normalized = boost::algorithm::to_lower_copy(std::string(provider));
    for (const auto& limit : kProviderLimits) {
        if (normalized == limit.name) {
            return &limit;
        }
    }
    for (const auto& limit : kProviderLimits) {
        std::string_view key(limit.name);
        if (normalized.find(key) != std::string::npos || key.find(normalized) != std::string_view::npos) {
            return &limit;
        }
    }
    return nullptr;
}

} // namespace

int64_t get_provider_token_limit(std::string_view provider, bool conservative) {
    const ProviderLimit* limit = find_provider(provider);
    return pick(limit != nullptr ? *limit : auto_limit(), conservative);
}

int64_t validate_provider_token_limit(std::string_view provider, int64_t configured_tokens, bool conservative) {
    const int64_t provider_limit = get_provider_token_limit(provider, conservative);

    if (configured_tokens <= 0) {
        VLOG_BUDGET << "no configured tokens for " << provider << ", using provider default: " << provider_limit;
        return provider_limit;
    }

    if (configured_tokens > provider_limit) {
        LOG(WARNING) << "configured max tokens (" << configured_tokens << ") exceeds " << provider << " limit ("
                     << provider_limit << "), adjusting to " << provider_limit;
        return provider_limit;
    }

    VLOG_BUDGET << "token limit validation passed: " << configured_tokens << " <= " << provider_limit
                << " for provider " << provider;
    return configured_tokens;
}

bool is_provider_supported(std::string_view provider) {
    return find_provider(provider) != nullptr;
}

std::vector<std::string> supported_providers() {
    std::vector<std::string> names;
    names.reserve(std::size(kProviderLimits));
    for (const auto& limit : kProviderLimits) {
        names.emplace_back(limit.name);
    }
    return names;
}

Status calculate_total_token_budget(const std::vector<ProviderQuota>& quotas, int64_t* total_budget) {
    if (quotas.empty()) {
        return Status::InvalidArgument("can not plan a token budget without any batch");
    }
    const double ratio = config::batch_budget_safety_ratio;
    if (!(ratio > 0 && ratio <= 1)) {
        return Status::InvalidArgument(fmt::format("batch_budget_safety_ratio must be in (0, 1], got {}", ratio));
    }

    const bool conservative = config::batch_use_conservative_provider_limits;
    int64_t min_limit = std::numeric_limits<int64_t>::max();
    for (const auto& quota : quotas) {
        int64_t limit =
                quota.max_tokens > 0 ? quota.max_tokens : get_provider_token_limit(quota.provider, conservative);
        min_limit = std::min(min_limit, limit);
    }

    *total_budget = static_cast<int64_t>(std::floor(static_cast<double>(quotas.size()) * min_limit * ratio));
    VLOG_BUDGET << "calculated total token budget: " << *total_budget << " (" << quotas.size() << " batches x "
                << min_limit << " x " << ratio << ", floored)";
    return Status::OK();
}

} // namespace batchgate
