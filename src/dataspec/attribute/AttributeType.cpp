#include "dataspec/attribute/AttributeType.hpp"

#include <array>

namespace DS {
namespace {

constexpr std::array kAllTypes{
    AttributeType::Integer,
    AttributeType::PositiveInteger,
    AttributeType::NonnegativeInteger,
    AttributeType::BoundedInteger,
    AttributeType::Float,
    AttributeType::PositiveFloat,
    AttributeType::NonnegativeFloat,
    AttributeType::BoundedFloat,
    AttributeType::String,
    AttributeType::UnrestrictedString,
    AttributeType::OptionString,
    AttributeType::Boolean,
    AttributeType::DataResource,
    AttributeType::OperationDataResource,
    AttributeType::VariableDataResource,
    AttributeType::StringList,
    AttributeType::UnrestrictedStringList,
    AttributeType::BoundedIntegerList,
    AttributeType::BoundedFloatList,
    AttributeType::Observation,
    AttributeType::Feature,
    AttributeType::ObservationSet,
    AttributeType::FeatureSet,
};

} // namespace

auto attributeTypeName(AttributeType type) -> std::string_view {
    switch (type) {
    case AttributeType::Integer:
        return "Integer";
    case AttributeType::PositiveInteger:
        return "PositiveInteger";
    case AttributeType::NonnegativeInteger:
        return "NonNegativeInteger";
    case AttributeType::BoundedInteger:
        return "BoundedInteger";
    case AttributeType::Float:
        return "Float";
    case AttributeType::PositiveFloat:
        return "PositiveFloat";
    case AttributeType::NonnegativeFloat:
        return "NonNegativeFloat";
    case AttributeType::BoundedFloat:
        return "BoundedFloat";
    case AttributeType::String:
        return "String";
    case AttributeType::UnrestrictedString:
        return "UnrestrictedString";
    case AttributeType::OptionString:
        return "OptionString";
    case AttributeType::Boolean:
        return "Boolean";
    case AttributeType::DataResource:
        return "DataResource";
    case AttributeType::OperationDataResource:
        return "OperationDataResource";
    case AttributeType::VariableDataResource:
        return "VariableDataResource";
    case AttributeType::StringList:
        return "StringList";
    case AttributeType::UnrestrictedStringList:
        return "UnrestrictedStringList";
    case AttributeType::BoundedIntegerList:
        return "BoundedIntegerList";
    case AttributeType::BoundedFloatList:
        return "BoundedFloatList";
    case AttributeType::Observation:
        return "Observation";
    case AttributeType::Feature:
        return "Feature";
    case AttributeType::ObservationSet:
        return "ObservationSet";
    case AttributeType::FeatureSet:
        return "FeatureSet";
    }
    return "Unknown";
}

auto attributeTypeFromName(std::string_view name) -> std::optional<AttributeType> {
    for (auto type : kAllTypes) {
        if (attributeTypeName(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

auto attributeTypeForDtype(std::string_view dtype, bool allowUnrestrictedStrings) -> AttributeType {
    // numpy/pandas names: "int", "int8" ... "int64", "float32", ...
    if (dtype.starts_with("int")) {
        return AttributeType::Integer;
    }
    if (dtype.starts_with("float")) {
        return AttributeType::Float;
    }
    return allowUnrestrictedStrings ? AttributeType::UnrestrictedString : AttributeType::String;
}

} // namespace DS
