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

#include <gtest/gtest.h>

#include <algorithm>

#include "common/config.h"
#include "testutil/assert.h"
#include "testutil/scoped_config.h"

namespace batchgate {

TEST(ProviderLimitsTest, exact_match) {
    ASSERT_EQ(65536, get_provider_token_limit("vertex"));
    ASSERT_EQ(65536, get_provider_token_limit("gemini", true));
    ASSERT_EQ(128000, get_provider_token_limit("openai"));
    ASSERT_EQ(120000, get_provider_token_limit("openai", true));
    ASSERT_EQ(200000, get_provider_token_limit("anthropic"));
    ASSERT_EQ(190000, get_provider_token_limit("claude", true));
    ASSERT_EQ(100000, get_provider_token_limit("bedrock"));
    ASSERT_EQ(95000, get_provider_token_limit("bedrock", true));
    ASSERT_EQ(60000, get_provider_token_limit("auto"));
}

TEST(ProviderLimitsTest, case_insensitive) {
    ASSERT_EQ(128000, get_provider_token_limit("OpenAI"));
    ASSERT_EQ(200000, get_provider_token_limit("ANTHROPIC"));
    ASSERT_TRUE(is_provider_supported("Azure"));
}

TEST(ProviderLimitsTest, partial_match) {
    ASSERT_EQ(200000, get_provider_token_limit("anthropic-claude-3"));
    ASSERT_EQ(128000, get_provider_token_limit("gpt-4o"));
    ASSERT_EQ(65536, get_provider_token_limit("vertex-ai"));
    // Contained in a known name.
    ASSERT_EQ(65536, get_provider_token_limit("google"));
    ASSERT_TRUE(is_provider_supported("aws-bedrock"));
}

TEST(ProviderLimitsTest, unknown_falls_back_to_auto) {
    ASSERT_EQ(60000, get_provider_token_limit("mistral"));
    ASSERT_EQ(60000, get_provider_token_limit("mistral", true));
    ASSERT_EQ(60000, get_provider_token_limit(""));
    ASSERT_FALSE(is_provider_supported("mistral"));
    ASSERT_FALSE(is_provider_supported(""));
}

TEST(ProviderLimitsTest, validate_token_limit) {
    ASSERT_EQ(4000, validate_provider_token_limit("openai", 4000));
    ASSERT_EQ(128000, validate_provider_token_limit("openai", 128000));
    ASSERT_EQ(128000, validate_provider_token_limit("openai", 150000));
    ASSERT_EQ(120000, validate_provider_token_limit("openai", 150000, true));
    ASSERT_EQ(65536, validate_provider_token_limit("vertex", 0));
    ASSERT_EQ(65536, validate_provider_token_limit("vertex", -1));
    ASSERT_EQ(60000, validate_provider_token_limit("mistral", 70000));
}

TEST(ProviderLimitsTest, supported_providers) {
    std::vector<std::string> providers = supported_providers();
    ASSERT_EQ(10u, providers.size());
    ASSERT_EQ("vertex", providers.front());
    ASSERT_EQ("auto", providers.back());
    for (const auto& name : providers) {
        ASSERT_TRUE(is_provider_supported(name)) << name;
    }
    ASSERT_NE(providers.end(), std::find(providers.begin(), providers.end(), "bedrock"));
}

TEST(ProviderLimitsTest, total_token_budget) {
    SCOPED_CONFIG(config::batch_budget_safety_ratio, 0.8);
    SCOPED_CONFIG(config::batch_use_conservative_provider_limits, true);

    int64_t budget = 0;
    // min(120000, 190000) * 2 * 0.8
    ASSERT_OK(calculate_total_token_budget({{"openai", 0}, {"anthropic", 0}}, &budget));
    ASSERT_EQ(192000, budget);

    // Explicit max_tokens wins over the provider limit.
    ASSERT_OK(calculate_total_token_budget({{"openai", 50000}, {"anthropic", 0}}, &budget));
    ASSERT_EQ(80000, budget);

    {
        SCOPED_CONFIG(config::batch_use_conservative_provider_limits, false);
        // floor(65536 * 0.8)
        ASSERT_OK(calculate_total_token_budget({{"vertex", 0}}, &budget));
        ASSERT_EQ(52428, budget);
    }
    {
        SCOPED_CONFIG(config::batch_budget_safety_ratio, 1.0);
        ASSERT_OK(calculate_total_token_budget({{"bedrock", 0}, {"bedrock", 0}, {"bedrock", 0}}, &budget));
        ASSERT_EQ(285000, budget);
    }
}

TEST(ProviderLimitsTest, total_token_budget_invalid) {
    int64_t budget = -1;
    Status st = calculate_total_token_budget({}, &budget);
    ASSERT_TRUE(st.is_invalid_argument()) << st;
    ASSERT_EQ(-1, budget);

    {
        SCOPED_CONFIG(config::batch_budget_safety_ratio, 0.0);
        st = calculate_total_token_budget({{"openai", 0}}, &budget);
        ASSERT_TRUE(st.is_invalid_argument()) << st;
    }
    {
        SCOPED_CONFIG(config::batch_budget_safety_ratio, 1.5);
        st = calculate_total_token_budget({{"openai", 0}}, &budget);
        ASSERT_TRUE(st.is_invalid_argument()) << st;
    }
    ASSERT_EQ(-1, budget);
}

} // namespace batchgate
