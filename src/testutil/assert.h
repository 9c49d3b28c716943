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

#include "common/logging.h"
#include "common/status.h"

#define CHECK_OK(stmt)            \
    do {                          \
        auto&& st__ = (stmt);     \
        CHECK(st__.ok()) << st__; \
    } while (0)

#define ASSERT_OK(stmt)                 \
    do {                                \
        auto&& st__ = (stmt);           \
        ASSERT_TRUE(st__.ok()) << st__; \
    } while (0)

// Compares the codes only, the messages may differ.
#define EXPECT_STATUS(expect, stmt)                                  \
    do {                                                             \
        Status exp = (expect);                                       \
        Status real = (stmt);                                        \
        EXPECT_EQ(exp.code(), real.code()) << exp << " vs " << real; \
    } while (0)
