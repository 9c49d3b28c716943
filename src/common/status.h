// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace batchgate {

enum class StatusCode : int8_t {
    OK = 0,
    INVALID_ARGUMENT = 1,
    NOT_FOUND = 2,
    NOT_SUPPORTED = 3,
    CONFIGURATION_ERROR = 4,
};

#ifndef BE_TEST
#define STATUS_ATTRIBUTE [[nodiscard]]
#else
#define STATUS_ATTRIBUTE
#endif

class STATUS_ATTRIBUTE Status {
public:
    Status() = default;

    ~Status() noexcept { delete[] _state; }

    Status(const Status& s) : _state(s._state == nullptr ? nullptr : copy_state(s._state)) {}

    // The moved-from status is OK.
    Status(Status&& s) noexcept : _state(s._state) { s._state = nullptr; }

    Status& operator=(const Status& s) {
        if (this != &s) {
            Status tmp(s);
            std::swap(_state, tmp._state);
        }
        return *this;
    }

    Status& operator=(Status&& s) noexcept {
        if (this != &s) {
            delete[] _state;
            _state = s._state;
            s._state = nullptr;
        }
        return *this;
    }

    static Status OK() { return Status(); }

    static Status InvalidArgument(std::string_view msg) { return Status(StatusCode::INVALID_ARGUMENT, msg); }
    static Status NotFound(std::string_view msg) { return Status(StatusCode::NOT_FOUND, msg); }
    static Status NotSupported(std::string_view msg) { return Status(StatusCode::NOT_SUPPORTED, msg); }
    // A value that was configured, or passed to a create() factory, is out of range.
    static Status ConfigurationError(std::string_view msg) {
        return Status(StatusCode::CONFIGURATION_ERROR, msg);
    }

    bool ok() const { return _state == nullptr; }

    bool is_invalid_argument() const { return code() == StatusCode::INVALID_ARGUMENT; }
    bool is_not_found() const { return code() == StatusCode::NOT_FOUND; }
    bool is_not_supported() const { return code() == StatusCode::NOT_SUPPORTED; }
    bool is_configuration_error() const { return code() == StatusCode::CONFIGURATION_ERROR; }

    StatusCode code() const { return _state == nullptr ? StatusCode::OK : static_cast<StatusCode>(_state[2]); }

    // "OK", or "<code>: <message>".
    std::string to_string() const;

    std::string code_as_string() const;

    // Empty for OK. Only valid while this Status is alive and unchanged.
    std::string_view message() const;

private:
    static const char* copy_state(const char* state);

    Status(StatusCode code, std::string_view msg);

    // nullptr for OK, otherwise a new[] array:
    //    _state[0..1]         == length of message
    //    _state[2]            == code
    //    _state[3..3 + len]   == message
    const char* _state = nullptr;
};

inline std::ostream& operator<<(std::ostream& os, const Status& st) {
    return os << st.to_string();
}

} // namespace batchgate
