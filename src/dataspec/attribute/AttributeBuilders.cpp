#include "attribute/AttributeBuilders.hpp"
#include "json/JsonReaders.hpp"
#include "log/TaggedLogger.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace DS::detail {
namespace {

constexpr char const* kMinimumKey = "min";
constexpr char const* kMaximumKey = "max";

[[nodiscard]] auto readBound(nlohmann::json const& raw, char const* key, bool integerBounds)
    -> Expected<NumericBound> {
    if (raw.is_number_unsigned()) {
        auto const v = raw.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::unexpected(make_error(Error::Code::InvalidParameter, key, "bound is out of range"));
        }
        return NumericBound{static_cast<std::int64_t>(v)};
    }
    if (raw.is_number_integer()) {
        return NumericBound{raw.get<std::int64_t>()};
    }
    if (!integerBounds && raw.is_number_float()) {
        auto const v = raw.get<double>();
        if (v != v) {
            return std::unexpected(make_error(Error::Code::InvalidParameter, key, "bound is not a number"));
        }
        return NumericBound{v};
    }
    return std::unexpected(make_error(Error::Code::InvalidParameter, key,
                                      "The value of the bound (" + echo_value(raw)
                                          + ") does not match the expected type for this bounded attribute."));
}

} // namespace

auto boundToJson(NumericBound const& bound) -> nlohmann::json {
    return std::visit([](auto v) { return nlohmann::json(v); }, bound);
}

auto boundAsDouble(NumericBound const& bound) -> double {
    return std::visit([](auto v) { return static_cast<double>(v); }, bound);
}

auto readBounds(nlohmann::json& parameters, bool integerBounds) -> Expected<AttributeParameters> {
    auto minimum = take_key(parameters, kMinimumKey);
    auto maximum = take_key(parameters, kMaximumKey);
    if (!minimum || !maximum) {
        return std::unexpected(make_error(Error::Code::MissingParameter,
                                          std::string("Bounds are required. Was missing: ") + (!minimum ? kMinimumKey : kMaximumKey)));
    }

    auto lower = readBound(*minimum, kMinimumKey, integerBounds);
    if (!lower) {
        return std::unexpected(lower.error());
    }
    auto upper = readBound(*maximum, kMaximumKey, integerBounds);
    if (!upper) {
        return std::unexpected(upper.error());
    }
    if (boundAsDouble(*lower) > boundAsDouble(*upper)) {
        return std::unexpected(make_error(Error::Code::InvalidParameter,
                                          "The minimum bound (" + minimum->dump() + ") exceeds the maximum bound ("
                                              + maximum->dump() + ")."));
    }

    AttributeParameters result;
    result.min = *lower;
    result.max = *upper;
    return result;
}

auto buildAttribute(AttributeTypeView const& view,
                    nlohmann::json const&    value,
                    nlohmann::json&          parameters,
                    BuildOptions const&      options) -> Expected<Attribute> {
    AttributeParameters typeParameters;
    if (view.operations.readParameters != nullptr) {
        auto read = view.operations.readParameters(parameters);
        if (!read) {
            return std::unexpected(read.error());
        }
        typeParameters = std::move(*read);
    }

    if (!parameters.empty() && !options.ignoreExtraKeys) {
        return std::unexpected(make_error(Error::Code::UnknownExtraParameter,
                                          std::string("The ") + std::string(view.type_name)
                                              + " attribute does not accept additional parameters. Received: "
                                              + join_keys(object_keys(parameters))));
    }

    if (value.is_null()) {
        if (!options.allowNull) {
            return std::unexpected(make_error(Error::Code::NullValue,
                                              std::string("Cannot set the value of a ") + std::string(view.type_name)
                                                  + " attribute to null unless nulls are allowed."));
        }
        return AttributeBuilder::make(view.type, std::monostate{}, std::move(typeParameters), true);
    }

    auto validated = view.operations.validate(value, typeParameters, options);
    if (!validated) {
        ds_log("Rejected " + std::string(view.type_name) + " value: " + describeError(validated.error()), "Attribute");
        return std::unexpected(validated.error());
    }
    return AttributeBuilder::make(view.type, std::move(*validated), std::move(typeParameters), options.allowNull);
}

} // namespace DS::detail
