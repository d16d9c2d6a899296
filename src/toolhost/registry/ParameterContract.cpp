//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ParameterContract.cpp
// Purpose: ParameterSchema validation and JSON-Schema conversion
//==========================================================================================================

#include "toolhost/registry/ParameterContract.h"
#include "toolhost/JSONHelpers.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace toolhost {
namespace registry {

namespace {

using Type = ParameterSchema::Type;

std::optional<Type> typeFromString(const std::string& s) {
    if (s == "string") return Type::String;
    if (s == "integer") return Type::Integer;
    if (s == "number") return Type::Number;
    if (s == "boolean") return Type::Boolean;
    if (s == "array") return Type::Array;
    if (s == "object") return Type::Object;
    return std::nullopt;
}

bool matchesType(const JSONValue& v, Type t) {
    switch (t) {
        case Type::String: return std::holds_alternative<std::string>(v.value);
        case Type::Boolean: return std::holds_alternative<bool>(v.value);
        case Type::Array: return std::holds_alternative<JSONValue::Array>(v.value);
        case Type::Object: return std::holds_alternative<JSONValue::Object>(v.value);
        case Type::Number:
            return std::holds_alternative<int64_t>(v.value) || std::holds_alternative<double>(v.value);
        case Type::Integer:
            if (std::holds_alternative<int64_t>(v.value)) return true;
            if (std::holds_alternative<double>(v.value)) {
                double d = std::get<double>(v.value);
                return std::isfinite(d) && std::floor(d) == d;
            }
            return false;
        case Type::Any: return true;
    }
    return false;
}

std::string formatNumber(double d) {
    std::ostringstream oss;
    if (std::floor(d) == d && std::fabs(d) < 1e15) {
        oss << static_cast<int64_t>(d);
    } else {
        oss << d;
    }
    return oss.str();
}

double asDouble(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) return static_cast<double>(std::get<int64_t>(v.value));
    return std::get<double>(v.value);
}

} // namespace

const char* toString(ParameterSchema::Type t) {
    switch (t) {
        case Type::String: return "string";
        case Type::Integer: return "integer";
        case Type::Number: return "number";
        case Type::Boolean: return "boolean";
        case Type::Array: return "array";
        case Type::Object: return "object";
        case Type::Any: return "any";
    }
    return "any";
}

ParameterSchema& ParameterSchema::Add(const std::string& name, Type type, const std::string& description, bool required) {
    auto it = std::find_if(properties_.begin(), properties_.end(),
                           [&](const Property& p) { return p.name == name; });
    Property p;
    p.name = name;
    p.type = type;
    p.required = required;
    p.description = description;
    if (it != properties_.end()) {
        // Re-adding a name replaces the property and makes it the modifier target.
        properties_.erase(it);
    }
    properties_.push_back(std::move(p));
    return *this;
}

ParameterSchema& ParameterSchema::AddString(const std::string& name, const std::string& description, bool required) {
    return Add(name, Type::String, description, required);
}
ParameterSchema& ParameterSchema::AddInteger(const std::string& name, const std::string& description, bool required) {
    return Add(name, Type::Integer, description, required);
}
ParameterSchema& ParameterSchema::AddNumber(const std::string& name, const std::string& description, bool required) {
    return Add(name, Type::Number, description, required);
}
ParameterSchema& ParameterSchema::AddBoolean(const std::string& name, const std::string& description, bool required) {
    return Add(name, Type::Boolean, description, required);
}
ParameterSchema& ParameterSchema::AddArray(const std::string& name, const std::string& description, bool required) {
    return Add(name, Type::Array, description, required);
}
ParameterSchema& ParameterSchema::AddObject(const std::string& name, const std::string& description, bool required) {
    return Add(name, Type::Object, description, required);
}

ParameterSchema::Property& ParameterSchema::last() {
    if (properties_.empty()) {
        throw std::logic_error("ParameterSchema modifier used before any property was added");
    }
    return properties_.back();
}

ParameterSchema& ParameterSchema::Enum(std::vector<std::string> values) {
    last().enumValues = std::move(values);
    return *this;
}

ParameterSchema& ParameterSchema::Range(std::optional<double> minimum, std::optional<double> maximum) {
    Property& p = last();
    p.minimum = minimum;
    p.maximum = maximum;
    return *this;
}

ParameterSchema& ParameterSchema::Items(Type itemType) {
    last().itemType = itemType;
    return *this;
}

ParameterSchema& ParameterSchema::Default(JSONValue value) {
    last().defaultValue = std::move(value);
    return *this;
}

ParameterSchema& ParameterSchema::AdditionalProperties(bool allowed) {
    additionalProperties_ = allowed;
    return *this;
}

ParameterValidation ParameterSchema::Validate(const JSONValue& params) const {
    ParameterValidation out;
    if (params.IsNull()) {
        return Validate(json::EmptyObject());
    }
    if (!params.IsObject()) {
        out.ok = false;
        out.issues.push_back("Parameters must be an object");
        return out;
    }
    const auto& obj = std::get<JSONValue::Object>(params.value);

    for (const auto& prop : properties_) {
        const JSONValue* v = json::Find(params, prop.name);
        if (v == nullptr || v->IsNull()) {
            if (prop.required) {
                out.issues.push_back("Missing required parameter '" + prop.name + "'");
            }
            continue;
        }
        if (!matchesType(*v, prop.type)) {
            out.issues.push_back("Parameter '" + prop.name + "' must be of type " + toString(prop.type));
            continue;
        }
        if (!prop.enumValues.empty() && std::holds_alternative<std::string>(v->value)) {
            const auto& s = std::get<std::string>(v->value);
            if (std::find(prop.enumValues.begin(), prop.enumValues.end(), s) == prop.enumValues.end()) {
                std::string allowed;
                for (std::size_t i = 0; i < prop.enumValues.size(); ++i) {
                    if (i > 0) allowed += ", ";
                    allowed += prop.enumValues[i];
                }
                out.issues.push_back("Parameter '" + prop.name + "' must be one of: " + allowed);
            }
        }
        if (prop.type == Type::Integer || prop.type == Type::Number) {
            const double d = asDouble(*v);
            if (prop.minimum.has_value() && d < *prop.minimum) {
                out.issues.push_back("Parameter '" + prop.name + "' must be >= " + formatNumber(*prop.minimum));
            }
            if (prop.maximum.has_value() && d > *prop.maximum) {
                out.issues.push_back("Parameter '" + prop.name + "' must be <= " + formatNumber(*prop.maximum));
            }
        }
        if (prop.type == Type::Array && prop.itemType.has_value()) {
            const auto& arr = std::get<JSONValue::Array>(v->value);
            for (const auto& item : arr) {
                if (!item || !matchesType(*item, *prop.itemType)) {
                    out.issues.push_back("Parameter '" + prop.name + "' items must be of type " +
                                         toString(*prop.itemType));
                    break;
                }
            }
        }
    }

    if (!additionalProperties_) {
        for (const auto& kv : obj) {
            auto known = std::any_of(properties_.begin(), properties_.end(),
                                     [&](const Property& p) { return p.name == kv.first; });
            if (!known) {
                out.issues.push_back("Unknown parameter '" + kv.first + "'");
            }
        }
    }

    out.ok = out.issues.empty();
    return out;
}

JSONValue ParameterSchema::ToJsonSchema() const {
    json::ObjectBuilder props;
    std::vector<std::string> required;
    for (const auto& p : properties_) {
        json::ObjectBuilder pb;
        if (p.type != Type::Any) pb.Set("type", toString(p.type));
        if (!p.description.empty()) pb.Set("description", p.description);
        if (!p.enumValues.empty()) pb.Set("enum", p.enumValues);
        if (p.minimum.has_value()) pb.Set("minimum", *p.minimum);
        if (p.maximum.has_value()) pb.Set("maximum", *p.maximum);
        if (p.itemType.has_value()) {
            pb.Set("items", json::ObjectBuilder().Set("type", toString(*p.itemType)).Build());
        }
        if (p.defaultValue.has_value()) pb.Set("default", *p.defaultValue);
        props.Set(p.name, pb.Build());
        if (p.required) required.push_back(p.name);
    }
    json::ObjectBuilder schema;
    schema.Set("type", "object").Set("properties", props.Build());
    if (!required.empty()) schema.Set("required", required);
    if (!additionalProperties_) schema.Set("additionalProperties", false);
    return schema.Build();
}

std::shared_ptr<ParameterSchema> ParameterSchema::FromJsonSchema(const JSONValue& schema) {
    if (!schema.IsObject()) {
        throw std::invalid_argument("Parameter schema must be a JSON object");
    }
    auto type = json::GetString(schema, "type");
    if (type.has_value() && *type != "object") {
        throw std::invalid_argument("Parameter schema must describe an object, got '" + *type + "'");
    }
    auto out = std::make_shared<ParameterSchema>();
    std::vector<std::string> required = json::GetStringList(schema, "required").value_or(std::vector<std::string>{});

    const JSONValue* props = json::Find(schema, "properties");
    if (props != nullptr && props->IsObject()) {
        // Sorted for a deterministic property order; the source object is unordered.
        std::vector<std::string> names;
        for (const auto& kv : std::get<JSONValue::Object>(props->value)) names.push_back(kv.first);
        std::sort(names.begin(), names.end());
        for (const auto& name : names) {
            const JSONValue& def = *json::Find(*props, name);
            Type t = Type::Any;
            if (auto ts = json::GetString(def, "type")) {
                t = typeFromString(*ts).value_or(Type::Any);
            }
            const bool isRequired = std::find(required.begin(), required.end(), name) != required.end();
            out->Add(name, t, json::GetString(def, "description").value_or(""), isRequired);
            if (auto e = json::GetStringList(def, "enum")) out->Enum(*e);
            auto mn = json::GetNumber(def, "minimum");
            auto mx = json::GetNumber(def, "maximum");
            if (mn.has_value() || mx.has_value()) out->Range(mn, mx);
            if (const JSONValue* items = json::Find(def, "items")) {
                if (auto its = json::GetString(*items, "type")) {
                    if (auto it = typeFromString(*its)) out->Items(*it);
                }
            }
            if (const JSONValue* d = json::Find(def, "default")) out->Default(*d);
        }
    }
    if (auto ap = json::GetBool(schema, "additionalProperties")) {
        out->AdditionalProperties(*ap);
    }
    return out;
}

std::shared_ptr<ParameterSchema> ParameterSchema::Empty() {
    return std::make_shared<ParameterSchema>();
}

} // namespace registry
} // namespace toolhost
