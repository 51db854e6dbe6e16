#pragma once

#include "attribute/AttributeTypeRegistry.hpp"
#include "dataspec/attribute/Attribute.hpp"
#include "dataspec/core/BuildOptions.hpp"
#include "dataspec/core/Error.hpp"

#include <string_view>

#include <nlohmann/json.hpp>

namespace DS::detail {

struct AttributeBuilder {
    [[nodiscard]] static auto make(AttributeType       type,
                                   Attribute::Value    value,
                                   AttributeParameters parameters,
                                   bool                allowNull) -> Attribute {
        return Attribute{type, std::move(value), std::move(parameters), allowNull};
    }
};

/**
 * Shared construction sequence for every registered type: consume the
 * type parameters, reject leftovers, apply the null rule, then validate.
 * `parameters` is the caller's private copy and is consumed.
 */
[[nodiscard]] auto buildAttribute(AttributeTypeView const& view,
                                  nlohmann::json const&    value,
                                  nlohmann::json&          parameters,
                                  BuildOptions const&      options) -> Expected<Attribute>;

/**
 * Reads "min" and "max". With `integerBounds` both must be JSON integers,
 * otherwise integers or floats. Missing bounds are MissingParameter, wrongly
 * typed or inverted bounds InvalidParameter.
 */
[[nodiscard]] auto readBounds(nlohmann::json& parameters, bool integerBounds) -> Expected<AttributeParameters>;

[[nodiscard]] auto boundToJson(NumericBound const& bound) -> nlohmann::json;
[[nodiscard]] auto boundAsDouble(NumericBound const& bound) -> double;

} // namespace DS::detail
