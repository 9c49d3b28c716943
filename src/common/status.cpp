// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#include "common/status.h"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <limits>

#include "common/logging.h"

namespace batchgate {

static constexpr size_t kHeaderSize = 3;

static uint16_t message_length(const char* state) {
    uint16_t len;
    memcpy(&len, state, sizeof(len));
    return len;
}

Status::Status(StatusCode code, std::string_view msg) {
    DCHECK(code != StatusCode::OK);
    // Longer messages are cut at 64KiB.
    const auto len = static_cast<uint16_t>(std::min<size_t>(msg.size(), std::numeric_limits<uint16_t>::max()));
    auto state = new char[kHeaderSize + len];
    memcpy(state, &len, sizeof(len));
    state[2] = static_cast<char>(code);
    memcpy(state + kHeaderSize, msg.data(), len);
    _state = state;
}

const char* Status::copy_state(const char* state) {
    const size_t size = kHeaderSize + message_length(state);
    auto result = new char[size];
    memcpy(result, state, size);
    return result;
}

std::string Status::code_as_string() const {
    switch (code()) {
    case StatusCode::OK:
        return "OK";
    case StatusCode::INVALID_ARGUMENT:
        return "Invalid argument";
    case StatusCode::NOT_FOUND:
        return "Not found";
    case StatusCode::NOT_SUPPORTED:
        return "Not supported";
    case StatusCode::CONFIGURATION_ERROR:
        return "Configuration error";
    }
    return fmt::format("Unknown code({})", static_cast<int>(code()));
}

std::string Status::to_string() const {
    if (ok()) {
        return "OK";
    }
    return fmt::format("{}: {}", code_as_string(), message());
}

std::string_view Status::message() const {
    if (_state == nullptr) {
        return {};
    }
    return {_state + kHeaderSize, message_length(_state)};
}

} // namespace batchgate
