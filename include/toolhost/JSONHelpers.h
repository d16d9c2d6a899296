//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONHelpers.h
// Purpose: Accessors and builders over JSONValue objects shared by the server modules
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace json {

// Member lookup; nullptr when obj is not an object or the key is absent.
inline const JSONValue* Find(const JSONValue& obj, const std::string& key) {
    if (!std::holds_alternative<JSONValue::Object>(obj.value)) return nullptr;
    const auto& o = std::get<JSONValue::Object>(obj.value);
    auto it = o.find(key);
    if (it == o.end() || !it->second) return nullptr;
    return it->second.get();
}

inline bool Has(const JSONValue& obj, const std::string& key) {
    return Find(obj, key) != nullptr;
}

inline std::optional<std::string> GetString(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = Find(obj, key);
    if (v == nullptr || !std::holds_alternative<std::string>(v->value)) return std::nullopt;
    return std::get<std::string>(v->value);
}

inline std::optional<bool> GetBool(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = Find(obj, key);
    if (v == nullptr || !std::holds_alternative<bool>(v->value)) return std::nullopt;
    return std::get<bool>(v->value);
}

// Integral values; doubles with no fractional part are accepted.
inline std::optional<int64_t> GetInt(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = Find(obj, key);
    if (v == nullptr) return std::nullopt;
    if (std::holds_alternative<int64_t>(v->value)) return std::get<int64_t>(v->value);
    if (std::holds_alternative<double>(v->value)) {
        double d = std::get<double>(v->value);
        if (d == static_cast<double>(static_cast<int64_t>(d))) return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

inline std::optional<double> GetNumber(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = Find(obj, key);
    if (v == nullptr) return std::nullopt;
    if (std::holds_alternative<int64_t>(v->value)) return static_cast<double>(std::get<int64_t>(v->value));
    if (std::holds_alternative<double>(v->value)) return std::get<double>(v->value);
    return std::nullopt;
}

inline const JSONValue::Array* GetArray(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = Find(obj, key);
    if (v == nullptr || !std::holds_alternative<JSONValue::Array>(v->value)) return nullptr;
    return &std::get<JSONValue::Array>(v->value);
}

// Array of strings; non-string items are skipped.
inline std::optional<std::vector<std::string>> GetStringList(const JSONValue& obj, const std::string& key) {
    const JSONValue::Array* arr = GetArray(obj, key);
    if (arr == nullptr) return std::nullopt;
    std::vector<std::string> out;
    for (const auto& item : *arr) {
        if (item && std::holds_alternative<std::string>(item->value)) {
            out.push_back(std::get<std::string>(item->value));
        }
    }
    return out;
}

//==========================================================================================================
// ObjectBuilder
// Purpose: Fluent construction of JSON objects without spelling out make_shared for every member.
//==========================================================================================================
class ObjectBuilder {
public:
    ObjectBuilder& Set(const std::string& key, JSONValue v) {
        obj[key] = std::make_shared<JSONValue>(std::move(v));
        return *this;
    }
    ObjectBuilder& Set(const std::string& key, const std::string& v) { return Set(key, JSONValue(v)); }
    ObjectBuilder& Set(const std::string& key, const char* v) { return Set(key, JSONValue(v)); }
    ObjectBuilder& Set(const std::string& key, bool v) { return Set(key, JSONValue(v)); }
    ObjectBuilder& Set(const std::string& key, int v) { return Set(key, JSONValue(static_cast<int64_t>(v))); }
    ObjectBuilder& Set(const std::string& key, int64_t v) { return Set(key, JSONValue(v)); }
    ObjectBuilder& Set(const std::string& key, uint64_t v) { return Set(key, JSONValue(static_cast<int64_t>(v))); }
    ObjectBuilder& Set(const std::string& key, double v) { return Set(key, JSONValue(v)); }
    ObjectBuilder& Set(const std::string& key, const std::vector<std::string>& v) {
        JSONValue::Array arr;
        for (const auto& s : v) arr.push_back(std::make_shared<JSONValue>(s));
        return Set(key, JSONValue(std::move(arr)));
    }
    ObjectBuilder& SetNull(const std::string& key) { return Set(key, JSONValue(nullptr)); }

    JSONValue Build() const { return JSONValue(obj); }
    JSONValue::Object& Raw() { return obj; }

private:
    JSONValue::Object obj;
};

inline JSONValue StringArray(const std::vector<std::string>& v) {
    JSONValue::Array arr;
    for (const auto& s : v) arr.push_back(std::make_shared<JSONValue>(s));
    return JSONValue(std::move(arr));
}

inline JSONValue EmptyObject() { return JSONValue(JSONValue::Object{}); }

// ISO-8601 UTC with millisecond precision, e.g. 2025-01-31T12:00:00.123Z
inline std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm buf{};
    ::gmtime_r(&t, &buf);
    char out[40];
    std::snprintf(out, sizeof(out), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  buf.tm_year + 1900, buf.tm_mon + 1, buf.tm_mday,
                  buf.tm_hour, buf.tm_min, buf.tm_sec, static_cast<int>(ms < 0 ? ms + 1000 : ms));
    return out;
}

inline JSONValue Timestamp(std::chrono::system_clock::time_point tp) {
    return JSONValue(FormatTimestamp(tp));
}

inline JSONValue Now() {
    return Timestamp(std::chrono::system_clock::now());
}

} // namespace json
} // namespace toolhost
