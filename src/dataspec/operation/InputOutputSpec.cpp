#include "dataspec/operation/InputOutputSpec.hpp"
#include "dataspec/attribute/AttributeFactory.hpp"
#include "json/JsonReaders.hpp"
#include "log/TaggedLogger.hpp"

namespace DS {
namespace {

constexpr char const* kDefaultKey = "default";
constexpr char const* kValueKey   = "value";

} // namespace

auto InputOutputSpec::fromJson(nlohmann::json const& json, BuildOptions const& options) -> Expected<InputOutputSpec> {
    if (!json.is_object()) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput,
                                                  "The constructor for an input or output specification expects an object."));
    }

    nlohmann::json attributeJson = json;
    auto           defaultValue  = detail::take_key(attributeJson, kDefaultKey);
    attributeJson[kValueKey]     = defaultValue.value_or(nlohmann::json(nullptr));

    auto buildOptions      = options;
    buildOptions.allowNull = !defaultValue.has_value();

    auto attribute = constructAttribute(attributeJson, buildOptions);
    if (!attribute) {
        ds_log("Failed to validate an input/output spec: " + describeError(attribute.error()), "Spec");
        return std::unexpected(attribute.error());
    }
    return InputOutputSpec{std::move(*attribute), std::move(defaultValue)};
}

auto InputOutputSpec::toJson() const -> nlohmann::json {
    auto json = this->attribute_.toJson();
    json.erase(kValueKey);
    if (this->default_) {
        json[kDefaultKey] = *this->default_;
    }
    return json;
}

} // namespace DS
