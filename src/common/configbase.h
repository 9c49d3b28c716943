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

#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace batchgate {
class Status;

namespace config {

struct ConfigInfo {
    std::string name;
    std::string value;
    std::string type;
    std::string defval;
    bool valmutable;

    bool operator<(const ConfigInfo& rhs) const { return name < rhs.name; }

    bool operator==(const ConfigInfo& rhs) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const ConfigInfo& info) {
    os << "ConfigInfo{"
       << "name=\"" << info.name << "\","
       << "value=\"" << info.value << "\","
       << "type=" << info.type << ","
       << "default=\"" << info.defval << "\","
       << "mutable=" << info.valmutable << "}";
    return os;
}

#ifdef __IN_CONFIGBASE_CPP__

} // namespace config
} // namespace batchgate

#include <boost/algorithm/string.hpp>

namespace batchgate {
namespace config {

bool strtox(const std::string& valstr, bool& retval);
bool strtox(const std::string& valstr, int32_t& retval);
bool strtox(const std::string& valstr, double& retval);
bool strtox(const std::string& valstr, std::string& retval);

// Comma separated list, empty items are skipped.
template <typename T>
bool strtox(const std::string& valstr, std::vector<T>& retval) {
    retval.clear();
    std::vector<std::string> items;
    boost::split(items, valstr, boost::is_any_of(","));
    for (auto& item : items) {
        boost::trim(item);
        if (item.empty()) {
            continue;
        }
        T parsed{};
        if (!strtox(item, parsed)) {
            retval.clear();
            return false;
        }
        retval.push_back(std::move(parsed));
    }
    return true;
}

template <typename T>
struct FieldTypeName;

template <>
struct FieldTypeName<bool> {
    static std::string name() { return "bool"; }
};
template <>
struct FieldTypeName<int32_t> {
    static std::string name() { return "int32"; }
};
template <>
struct FieldTypeName<double> {
    static std::string name() { return "double"; }
};
template <>
struct FieldTypeName<std::string> {
    static std::string name() { return "string"; }
};
template <typename T>
struct FieldTypeName<std::vector<T>> {
    static std::string name() { return "list<" + FieldTypeName<T>::name() + ">"; }
};

class Field {
public:
    static std::map<std::string, Field*>& fields() {
        static std::map<std::string, Field*> s_fields;
        return s_fields;
    }

    static std::optional<Field*> get(const std::string& name);

    Field(std::string type, const char* name, const char* defval, bool valmutable)
            : _type(std::move(type)), _name(name), _defval(defval), _valmutable(valmutable) {
        fields()[_name] = this;
    }

    virtual ~Field() = default;

    const std::string& type() const { return _type; }
    const std::string& name() const { return _name; }
    const std::string& defval() const { return _defval; }
    bool valmutable() const { return _valmutable; }

    // The last successfully parsed textual value.
    const std::string& value() const { return _current_set_val; }

    bool set_value(std::string value);

    // Re-apply the value before the last successful set_value().
    bool rollback();

protected:
    virtual bool parse_value(const std::string& valstr) = 0;

private:
    std::string _type;
    std::string _name;
    std::string _defval;
    bool _valmutable;

    std::string _current_set_val;
    std::string _last_set_val;
};

template <typename T>
class TypedField final : public Field {
public:
    TypedField(const char* name, T* storage, const char* defval, bool valmutable)
            : Field(FieldTypeName<T>::name(), name, defval, valmutable), _storage(storage) {}

protected:
    bool parse_value(const std::string& valstr) override {
        T tmp{};
        if (!strtox(valstr, tmp)) {
            return false;
        }
        *_storage = std::move(tmp);
        return true;
    }

private:
    T* _storage;
};

#define DEFINE_FIELD(FIELD_TYPE, FIELD_NAME, FIELD_DEFAULT, VALMUTABLE) \
    FIELD_TYPE FIELD_NAME;                                              \
    static TypedField<FIELD_TYPE> field_##FIELD_NAME(#FIELD_NAME, &FIELD_NAME, FIELD_DEFAULT, VALMUTABLE);

#define CONF_Int32(name, defaultstr) DEFINE_FIELD(int32_t, name, defaultstr, false)
#define CONF_String(name, defaultstr) DEFINE_FIELD(std::string, name, defaultstr, false)
#define CONF_Strings(name, defaultstr) DEFINE_FIELD(std::vector<std::string>, name, defaultstr, false)
#define CONF_mBool(name, defaultstr) DEFINE_FIELD(bool, name, defaultstr, true)
#define CONF_mInt32(name, defaultstr) DEFINE_FIELD(int32_t, name, defaultstr, true)
#define CONF_mDouble(name, defaultstr) DEFINE_FIELD(double, name, defaultstr, true)

#else

#define DECLARE_FIELD(FIELD_TYPE, FIELD_NAME) extern FIELD_TYPE FIELD_NAME;

#define CONF_Int32(name, defaultstr) DECLARE_FIELD(int32_t, name)
#define CONF_String(name, defaultstr) DECLARE_FIELD(std::string, name)
#define CONF_Strings(name, defaultstr) DECLARE_FIELD(std::vector<std::string>, name)
#define CONF_mBool(name, defaultstr) DECLARE_FIELD(bool, name)
#define CONF_mInt32(name, defaultstr) DECLARE_FIELD(int32_t, name)
#define CONF_mDouble(name, defaultstr) DECLARE_FIELD(double, name)

#endif // __IN_CONFIGBASE_CPP__

// Resets every field to its default, then applies the "key = value" lines of
// the file. A null filename only applies the defaults.
bool init(const char* filename);

bool init(std::istream& input);

Status set_config(const std::string& field, const std::string& value);

Status rollback_config(const std::string& field);

std::vector<ConfigInfo> list_configs();

} // namespace config
} // namespace batchgate
