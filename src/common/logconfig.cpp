// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include <glog/logging.h>
#include <glog/vlog_is_on.h>

#include <boost/algorithm/string.hpp>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

#include "common/config.h"
#include "common/logging.h"

namespace batchgate {

static std::mutex g_logging_lock;
static bool g_logging_initialized = false;

// INFO/WARNING/ERROR/FATAL, case-insensitive, to a glog severity. -1 if unknown.
static int parse_severity(const std::string& level) {
    static const char* const kSeverities[] = {"INFO", "WARNING", "ERROR", "FATAL"};
    for (int i = 0; i < 4; ++i) {
        if (boost::iequals(level, kSeverities[i])) {
            return i;
        }
    }
    return -1;
}

// "SIZE-MB-nnn" to nnn. 0 if malformed.
static int32_t parse_roll_size_mb(const std::string& mode) {
    static constexpr std::string_view kPrefix = "SIZE-MB-";
    if (mode.size() <= kPrefix.size() || mode.compare(0, kPrefix.size(), kPrefix) != 0) {
        return 0;
    }
    const char* digits = mode.c_str() + kPrefix.size();
    char* end = nullptr;
    errno = 0;
    long long size = std::strtoll(digits, &end, 10);
    if (errno != 0 || *end != '\0' || size <= 0 || size > INT32_MAX) {
        return 0;
    }
    return static_cast<int32_t>(size);
}

bool init_glog(const char* basename, bool install_signal_handler) {
    std::lock_guard l(g_logging_lock);
    if (g_logging_initialized) {
        return true;
    }

    const int severity = parse_severity(config::sys_log_level);
    if (severity < 0) {
        std::cerr << "sys_log_level needs to be INFO, WARNING, ERROR, FATAL" << std::endl;
        return false;
    }
    const int32_t roll_size_mb = parse_roll_size_mb(config::sys_log_roll_mode);
    if (roll_size_mb == 0) {
        std::cerr << "sys_log_roll_mode needs to be SIZE-MB-nnn" << std::endl;
        return false;
    }

    if (install_signal_handler) {
        google::InstallFailureSignalHandler();
    }

    if (!config::sys_log_dir.empty()) {
        FLAGS_log_dir = config::sys_log_dir;
    }
    FLAGS_minloglevel = severity;
    FLAGS_max_log_size = roll_size_mb;
    // Only FATAL reaches stderr.
    FLAGS_stderrthreshold = google::GLOG_FATAL;
    // Buffer INFO only, and for at most 30 seconds.
    FLAGS_logbuflevel = google::GLOG_INFO;
    FLAGS_logbufsecs = 30;

    // Verbose logging is off except for the listed modules.
    FLAGS_v = -1;
    for (const auto& module : config::sys_log_verbose_modules) {
        google::SetVLOGLevel(module.c_str(), config::sys_log_verbose_level);
    }

    google::InitGoogleLogging(basename);
    g_logging_initialized = true;
    return true;
}

void shutdown_logging() {
    std::lock_guard l(g_logging_lock);
    if (!g_logging_initialized) {
        return;
    }
    google::ShutdownGoogleLogging();
    g_logging_initialized = false;
}

} // namespace batchgate
