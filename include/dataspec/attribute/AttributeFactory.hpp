#pragma once
#include "dataspec/attribute/Attribute.hpp"
#include "dataspec/core/BuildOptions.hpp"
#include "dataspec/core/Error.hpp"

#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace DS {

enum class AttributeScope {
    // Scalar, resource and list types only; used for attributes nested inside an Element.
    LeafOnly,
    // Leaf types plus Observation, Feature, ObservationSet and FeatureSet.
    All
};

/**
 * Builds an Attribute from {"attribute_type": <tag>, "value": <any|null>, <tag-specific keys>...}.
 *
 * The input is never modified. Failure kinds:
 * - MalformedInput when `json` is not an object
 * - UnknownType when "attribute_type" is absent or names no type in `scope`
 * - MissingValue when "value" is absent (null has to be explicit)
 * - anything the type itself reports (NullValue, InvalidValue, MissingParameter,
 *   InvalidParameter, UnknownExtraParameter, MalformedInput)
 */
[[nodiscard]] auto constructAttribute(nlohmann::json const& json,
                                      BuildOptions const&   options = {},
                                      AttributeScope        scope   = AttributeScope::All) -> Expected<Attribute>;

[[nodiscard]] auto constructLeafAttribute(nlohmann::json const& json, BuildOptions const& options = {}) -> Expected<Attribute>;

// Type names accepted by constructAttribute for the given scope, in declaration order.
[[nodiscard]] auto registeredAttributeTypeNames(AttributeScope scope = AttributeScope::All) -> std::vector<std::string_view>;

} // namespace DS
