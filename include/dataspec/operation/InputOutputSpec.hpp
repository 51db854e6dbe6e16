#pragma once
#include "dataspec/attribute/Attribute.hpp"
#include "dataspec/core/BuildOptions.hpp"
#include "dataspec/core/Error.hpp"

#include <optional>

#include <nlohmann/json.hpp>

namespace DS {

/**
 * The declared shape of one operation input or output:
 * {"attribute_type": <tag>, <tag parameters>..., "default"?: <value>}.
 *
 * Construction validates the parameters and the default, if one is given,
 * through the full attribute factory. Without a default the underlying
 * attribute holds a null placeholder and allows nulls.
 */
class InputOutputSpec {
public:
    [[nodiscard]] static auto fromJson(nlohmann::json const& json, BuildOptions const& options = {})
        -> Expected<InputOutputSpec>;

    [[nodiscard]] auto attribute() const -> Attribute const& { return this->attribute_; }
    [[nodiscard]] auto type() const -> AttributeType { return this->attribute_.type(); }
    [[nodiscard]] auto hasDefault() const -> bool { return this->default_.has_value(); }
    [[nodiscard]] auto defaultValue() const -> std::optional<nlohmann::json> const& { return this->default_; }

    // The attribute JSON without "value", plus "default" exactly as submitted.
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    auto operator==(InputOutputSpec const& other) const -> bool { return this->attribute_ == other.attribute_; }

private:
    InputOutputSpec(Attribute attribute, std::optional<nlohmann::json> defaultValue)
        : attribute_(std::move(attribute)), default_(std::move(defaultValue)) {}

    Attribute                     attribute_;
    std::optional<nlohmann::json> default_;
};

} // namespace DS
