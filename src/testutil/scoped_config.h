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

#include <type_traits>
#include <utility>

namespace batchgate {

// Overrides a config:: field and restores the previous value when destroyed.
template <typename T>
class ScopedConfigOverride {
public:
    ScopedConfigOverride(T* field, T value) : _field(field), _saved(std::move(*field)) { *_field = std::move(value); }

    ~ScopedConfigOverride() { *_field = std::move(_saved); }

private:
    ScopedConfigOverride(const ScopedConfigOverride&) = delete;
    const ScopedConfigOverride& operator=(const ScopedConfigOverride&) = delete;

    T* _field;
    T _saved;
};

#define SCOPED_CONFIG_CONCAT_INNER(x, y) x##y
#define SCOPED_CONFIG_CONCAT(x, y) SCOPED_CONFIG_CONCAT_INNER(x, y)

// SCOPED_CONFIG(config::batch_max_concurrent, 6);
#define SCOPED_CONFIG(field, value)                                                   \
    ::batchgate::ScopedConfigOverride<std::decay_t<decltype(field)>> SCOPED_CONFIG_CONCAT( \
            _scoped_config_, __LINE__)(&(field), value)

} // namespace batchgate
