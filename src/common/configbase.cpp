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

#include <fstream>
#include <iostream>
#include <set>
#include <string>

#define __IN_CONFIGBASE_CPP__
#include "common/config.h"
#undef __IN_CONFIGBASE_CPP__

#include <fmt/format.h>

#include <cerrno>
#include <cstdlib>
#include <limits>

#include "common/status.h"

namespace batchgate::config {

// Expands every ${NAME} in 'value' with the environment variable NAME.
static Status expand_env(std::string* value) {
    std::size_t from = 0;
    while (true) {
        std::size_t begin = value->find("${", from);
        if (begin == std::string::npos) {
            return Status::OK();
        }
        std::size_t end = value->find('}', begin + 2);
        if (end == std::string::npos) {
            return Status::InvalidArgument(fmt::format("unclosed ${{ in '{}'", *value));
        }
        const std::string name = value->substr(begin + 2, end - begin - 2);
        const char* env = std::getenv(name.c_str());
        if (env == nullptr) {
            return Status::InvalidArgument(fmt::format("environment variable {} is not set", name));
        }
        value->replace(begin, end - begin + 1, env);
        from = begin + std::char_traits<char>::length(env);
    }
}

bool strtox(const std::string& valstr, bool& retval) {
    if (boost::iequals(valstr, "true") || valstr == "1") {
        retval = true;
        return true;
    }
    if (boost::iequals(valstr, "false") || valstr == "0") {
        retval = false;
        return true;
    }
    return false;
}

bool strtox(const std::string& valstr, int32_t& retval) {
    if (valstr.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(valstr.c_str(), &end, 10);
    if (errno != 0 || end != valstr.c_str() + valstr.size() || parsed < std::numeric_limits<int32_t>::min() ||
        parsed > std::numeric_limits<int32_t>::max()) {
        return false;
    }
    retval = static_cast<int32_t>(parsed);
    return true;
}

bool strtox(const std::string& valstr, double& retval) {
    if (valstr.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(valstr.c_str(), &end);
    if (errno != 0 || end != valstr.c_str() + valstr.size()) {
        return false;
    }
    retval = parsed;
    return true;
}

bool strtox(const std::string& valstr, std::string& retval) {
    retval = valstr;
    return true;
}

std::optional<Field*> Field::get(const std::string& name) {
    auto it = fields().find(name);
    if (it == fields().end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Field::set_value(std::string value) {
    if (!expand_env(&value).ok()) {
        return false;
    }
    boost::trim(value);
    if (!parse_value(value)) {
        return false;
    }
    _last_set_val = std::move(_current_set_val);
    _current_set_val = std::move(value);
    return true;
}

bool Field::rollback() {
    if (!parse_value(_last_set_val)) {
        return false;
    }
    _current_set_val = std::move(_last_set_val);
    _last_set_val.clear();
    return true;
}

static bool reset_to_defaults() {
    for (const auto& [name, field] : Field::fields()) {
        if (!field->set_value(field->defval())) {
            std::cerr << fmt::format("Invalid default value of config '{}': '{}'\n", name, field->defval());
            return false;
        }
    }
    return true;
}

// "key = value", "key =" and a bare "key" all assign; the value is everything
// after the first '='. Returns false only on a value that does not parse.
static bool apply_line(const std::string& line, std::set<Field*>* assigned) {
    const std::size_t eq = line.find('=');
    std::string key = boost::trim_copy(line.substr(0, eq));
    std::string value = eq == std::string::npos ? std::string() : line.substr(eq + 1);

    auto field = Field::get(key);
    if (!field.has_value()) {
        // Upper case names are environment settings sharing the file, e.g. JAVA_OPTS.
        if (key.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_") != std::string::npos) {
            std::cerr << fmt::format("Ignored unknown config: {}\n", key);
        }
        return true;
    }
    if (!assigned->insert(*field).second) {
        std::cerr << fmt::format("Config '{}' is assigned more than once, the last one wins\n", key);
    }
    if (!(*field)->set_value(value)) {
        std::cerr << fmt::format("Invalid value of config '{}': '{}'\n", key, value);
        return false;
    }
    return true;
}

bool init(const char* filename) {
    if (filename == nullptr) {
        return reset_to_defaults();
    }
    std::ifstream input(filename);
    if (!input) {
        std::cerr << "Fail to open " << filename << std::endl;
        return false;
    }
    return init(input);
}

bool init(std::istream& input) {
    if (!reset_to_defaults()) {
        return false;
    }
    std::set<Field*> assigned;
    std::string line;
    while (std::getline(input, line)) {
        boost::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (!apply_line(line, &assigned)) {
            return false;
        }
    }
    return true;
}

Status set_config(const std::string& field, const std::string& value) {
    auto found = Field::get(field);
    if (!found.has_value()) {
        return Status::NotFound(fmt::format("'{}' is not found", field));
    }
    if (!(*found)->valmutable()) {
        return Status::NotSupported(fmt::format("'{}' is immutable", field));
    }
    if (!(*found)->set_value(value)) {
        return Status::InvalidArgument(fmt::format("Invalid value of config '{}': '{}'", field, value));
    }
    return Status::OK();
}

Status rollback_config(const std::string& field) {
    auto found = Field::get(field);
    if (!found.has_value()) {
        return Status::NotFound(fmt::format("'{}' is not found in rollback", field));
    }
    if (!(*found)->rollback()) {
        return Status::InvalidArgument(fmt::format("Invalid value of config '{}' in rollback", field));
    }
    return Status::OK();
}

std::vector<ConfigInfo> list_configs() {
    std::vector<ConfigInfo> infos;
    infos.reserve(Field::fields().size());
    for (const auto& [name, field] : Field::fields()) {
        infos.push_back({name, field->value(), field->type(), field->defval(), field->valmutable()});
    }
    return infos;
}

} // namespace batchgate::config
