#pragma once
#include <optional>
#include <string_view>

namespace DS {

enum class AttributeType {
    Integer,
    PositiveInteger,
    NonnegativeInteger,
    BoundedInteger,
    Float,
    PositiveFloat,
    NonnegativeFloat,
    BoundedFloat,
    String,
    UnrestrictedString,
    OptionString,
    Boolean,
    DataResource,
    OperationDataResource,
    VariableDataResource,
    StringList,
    UnrestrictedStringList,
    BoundedIntegerList,
    BoundedFloatList,
    Observation,
    Feature,
    ObservationSet,
    FeatureSet
};

/**
 * Discriminator written under "attribute_type" in the JSON form.
 */
[[nodiscard]] auto attributeTypeName(AttributeType type) -> std::string_view;

/**
 * Reverse of attributeTypeName. Case-sensitive.
 */
[[nodiscard]] auto attributeTypeFromName(std::string_view name) -> std::optional<AttributeType>;

[[nodiscard]] constexpr auto isCompoundType(AttributeType type) -> bool {
    return type == AttributeType::Observation || type == AttributeType::Feature
           || type == AttributeType::ObservationSet || type == AttributeType::FeatureSet;
}

[[nodiscard]] constexpr auto isListType(AttributeType type) -> bool {
    return type == AttributeType::StringList || type == AttributeType::UnrestrictedStringList
           || type == AttributeType::BoundedIntegerList || type == AttributeType::BoundedFloatList;
}

[[nodiscard]] constexpr auto isResourceType(AttributeType type) -> bool {
    return type == AttributeType::DataResource || type == AttributeType::OperationDataResource
           || type == AttributeType::VariableDataResource;
}

// Resources owned by a user, as opposed to files bundled with an operation.
[[nodiscard]] constexpr auto isUserResourceType(AttributeType type) -> bool {
    return type == AttributeType::DataResource || type == AttributeType::VariableDataResource;
}

[[nodiscard]] constexpr auto isBoundedType(AttributeType type) -> bool {
    return type == AttributeType::BoundedInteger || type == AttributeType::BoundedFloat
           || type == AttributeType::BoundedIntegerList || type == AttributeType::BoundedFloatList;
}

/**
 * Maps a tabular column dtype ("int64", "float32", "object", ...) onto the
 * attribute type used to describe it.
 */
[[nodiscard]] auto attributeTypeForDtype(std::string_view dtype, bool allowUnrestrictedStrings = false) -> AttributeType;

} // namespace DS
