//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ParameterContract.h
// Purpose: Parameter-validation contract attached to every registered tool
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace registry {

struct ParameterValidation {
    bool ok{true};
    std::vector<std::string> issues;
};

//==========================================================================================================
// IParameterContract
// Purpose: Declares the shape of a tool's input and checks caller-supplied parameters against it.
//==========================================================================================================
class IParameterContract {
public:
    virtual ~IParameterContract() = default;

    //==========================================================================================================
    // Validate
    // Args:
    //   params: Caller-supplied parameters. A null value is treated as an empty object.
    // Returns:
    //   ok=false with one human-readable issue per violation.
    //==========================================================================================================
    virtual ParameterValidation Validate(const JSONValue& params) const = 0;

    // JSON-Schema rendering advertised as inputSchema.
    virtual JSONValue ToJsonSchema() const = 0;
};

//==========================================================================================================
// ParameterSchema
// Purpose: Object-shaped IParameterContract with typed properties.
// Notes:
//   Modifiers (Enum, Range, Items, Default) apply to the most recently added property.
//   Example:
//     auto schema = std::make_shared<ParameterSchema>();
//     schema->AddString("toolName", "Name of the tool", true)
//           .AddBoolean("isActive", "Whether the tool should be active", true);
//==========================================================================================================
class ParameterSchema : public IParameterContract {
public:
    enum class Type {
        String,
        Integer,
        Number,
        Boolean,
        Array,
        Object,
        Any
    };

    struct Property {
        std::string name;
        Type type{Type::Any};
        bool required{false};
        std::string description;
        std::optional<JSONValue> defaultValue;
        std::vector<std::string> enumValues;
        std::optional<double> minimum;
        std::optional<double> maximum;
        std::optional<Type> itemType;
    };

    ParameterSchema() = default;

    ParameterSchema& Add(const std::string& name, Type type, const std::string& description, bool required = false);
    ParameterSchema& AddString(const std::string& name, const std::string& description, bool required = false);
    ParameterSchema& AddInteger(const std::string& name, const std::string& description, bool required = false);
    ParameterSchema& AddNumber(const std::string& name, const std::string& description, bool required = false);
    ParameterSchema& AddBoolean(const std::string& name, const std::string& description, bool required = false);
    ParameterSchema& AddArray(const std::string& name, const std::string& description, bool required = false);
    ParameterSchema& AddObject(const std::string& name, const std::string& description, bool required = false);

    ParameterSchema& Enum(std::vector<std::string> values);
    ParameterSchema& Range(std::optional<double> minimum, std::optional<double> maximum);
    ParameterSchema& Items(Type itemType);
    ParameterSchema& Default(JSONValue value);
    ParameterSchema& AdditionalProperties(bool allowed);

    const std::vector<Property>& Properties() const { return properties_; }

    ParameterValidation Validate(const JSONValue& params) const override;
    JSONValue ToJsonSchema() const override;

    //==========================================================================================================
    // FromJsonSchema
    // Purpose: Builds a schema from a JSON-Schema object ({type:"object", properties, required,
    //          additionalProperties}). Unknown keywords are ignored.
    // Notes:
    //   Throws std::invalid_argument when the document is not an object schema.
    //==========================================================================================================
    static std::shared_ptr<ParameterSchema> FromJsonSchema(const JSONValue& schema);

    // A contract accepting any object.
    static std::shared_ptr<ParameterSchema> Empty();

private:
    Property& last();

    std::vector<Property> properties_;
    bool additionalProperties_{true};
};

const char* toString(ParameterSchema::Type t);

} // namespace registry
} // namespace toolhost
