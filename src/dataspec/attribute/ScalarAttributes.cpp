#include "attribute/AttributeBuilders.hpp"
#include "attribute/AttributeTypeRegistry.hpp"
#include "core/Validation.hpp"
#include "json/JsonReaders.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace DS {
namespace {

using detail::echo_value;
using detail::make_error;
using Json = nlohmann::json;

constexpr char const* kOptionsKey = "options";

[[nodiscard]] auto invalid(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{Error::Code::InvalidValue, std::move(message)});
}

// JSON integers only; floats such as 3.0 and booleans are not integers here.
[[nodiscard]] auto readInteger(Json const& value) -> std::optional<std::int64_t> {
    if (value.is_number_unsigned()) {
        auto const v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(v);
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    return std::nullopt;
}

[[nodiscard]] auto readFloat(Json const& value) -> std::optional<FloatValue> {
    if (value.is_number_integer()) {
        return value.is_number_unsigned() ? FloatValue::finite(static_cast<double>(value.get<std::uint64_t>()))
                                          : FloatValue::finite(static_cast<double>(value.get<std::int64_t>()));
    }
    if (value.is_number_float()) {
        auto const v = value.get<double>();
        if (std::isnan(v)) {
            return std::nullopt;
        }
        if (std::isinf(v)) {
            return v > 0 ? FloatValue::positiveInfinity() : FloatValue::negativeInfinity();
        }
        return FloatValue::finite(v);
    }
    if (value.is_string()) {
        auto const& text = value.get_ref<std::string const&>();
        if (text == kPositiveInfinityMarker) {
            return FloatValue::positiveInfinity();
        }
        if (text == kNegativeInfinityMarker) {
            return FloatValue::negativeInfinity();
        }
    }
    return std::nullopt;
}

auto validateInteger(Json const& value, AttributeParameters const&, BuildOptions const&) -> Expected<Attribute::Value> {
    auto v = readInteger(value);
    if (!v) {
        return invalid("An integer attribute was expected, but the value \"" + echo_value(value)
                       + "\" could not be cast as an integer.");
    }
    return Attribute::Value{*v};
}

auto validatePositiveInteger(Json const& value, AttributeParameters const&, BuildOptions const&) -> Expected<Attribute::Value> {
    auto v = readInteger(value);
    if (!v) {
        return invalid("A positive integer was expected, but \"" + echo_value(value) + "\" is not an integer.");
    }
    if (*v <= 0) {
        return invalid("The value " + std::to_string(*v) + " was not a positive integer.");
    }
    return Attribute::Value{*v};
}

auto validateNonnegativeInteger(Json const& value, AttributeParameters const&, BuildOptions const&) -> Expected<Attribute::Value> {
    auto v = readInteger(value);
    if (!v) {
        return invalid("A non-negative integer attribute was expected, but \"" + echo_value(value)
                       + "\" is not an integer.");
    }
    if (*v < 0) {
        return invalid("The value " + std::to_string(*v) + " is not a non-negative integer.");
    }
    return Attribute::Value{*v};
}

auto describeBounds(AttributeParameters const& parameters) -> std::string {
    return "[" + detail::boundToJson(*parameters.min).dump() + "," + detail::boundToJson(*parameters.max).dump() + "]";
}

auto validateBoundedInteger(Json const& value, AttributeParameters const& parameters, BuildOptions const&)
    -> Expected<Attribute::Value> {
    auto v = readInteger(value);
    if (!v) {
        return invalid("A bounded integer attribute was expected, but \"" + echo_value(value) + "\" is not an integer.");
    }
    auto const lower = std::get<std::int64_t>(*parameters.min);
    auto const upper = std::get<std::int64_t>(*parameters.max);
    if (*v < lower || *v > upper) {
        return invalid("The value " + std::to_string(*v) + " is not within the bounds of " + describeBounds(parameters));
    }
    return Attribute::Value{*v};
}

auto validateFloat(Json const& value, AttributeParameters const&, BuildOptions const&) -> Expected<Attribute::Value> {
    auto v = readFloat(value);
    if (!v) {
        return invalid("A float attribute was expected, but received \"" + echo_value(value) + "\"");
    }
    return Attribute::Value{*v};
}

auto validatePositiveFloat(Json const& value, AttributeParameters const&, BuildOptions const&) -> Expected<Attribute::Value> {
    auto v = readFloat(value);
    if (!v || v->kind == FloatValue::Kind::NegativeInfinity) {
        return invalid("A positive float attribute was expected, but received \"" + echo_value(value) + "\"");
    }
    if (v->isFinite() && !(v->value > 0.0)) {
        return invalid("Received a valid float (" + echo_value(value) + "), but it was not > 0.");
    }
    return Attribute::Value{*v};
}

auto validateNonnegativeFloat(Json const& value, AttributeParameters const&, BuildOptions const&) -> Expected<Attribute::Value> {
    auto v = readFloat(value);
    if (!v || v->kind == FloatValue::Kind::NegativeInfinity) {
        return invalid("A non-negative float attribute was expected, but received \"" + echo_value(value) + "\"");
    }
    if (v->isFinite() && v->value < 0.0) {
        return invalid("Received a valid float (" + echo_value(value) + "), but it was not >= 0.");
    }
    return Attribute::Value{*v};
}

auto validateBoundedFloat(Json const& value, AttributeParameters const& parameters, BuildOptions const&)
    -> Expected<Attribute::Value> {
    auto v = readFloat(value);
    if (!v) {
        return invalid("A bounded float attribute was expected, but \"" + echo_value(value) + "\" is not a float.");
    }
    auto const lower = detail::boundAsDouble(*parameters.min);
    auto const upper = detail::boundAsDouble(*parameters.max);
    if (!v->isFinite() || v->value < lower || v->value > upper) {
        return invalid("The value " + echo_value(value) + " is not within the bounds of " + describeBounds(parameters));
    }
    return Attribute::Value{*v};
}

auto validateString(Json const& value, AttributeParameters const&, BuildOptions const&) -> Expected<Attribute::Value> {
    if (!value.is_string()) {
        return invalid("The value " + echo_value(value) + " was not a string.");
    }
    auto normalized = detail::normalizeIdentifier(value.get_ref<std::string const&>());
    if (!normalized) {
        return std::unexpected(normalized.error());
    }
    if (normalized->size() > detail::kMaxStringLength) {
        return invalid("The submitted attribute " + echo_value(value) + " was longer than we permit ("
                       + std::to_string(detail::kMaxStringLength) + " chars).");
    }
    return Attribute::Value{std::move(*normalized)};
}

auto validateUnrestrictedString(Json const& value, AttributeParameters const&, BuildOptions const&)
    -> Expected<Attribute::Value> {
    auto text = value.is_string() ? value.get<std::string>() : value.dump();
    if (text.size() > detail::kMaxStringLength) {
        return invalid("The submitted attribute " + echo_value(value) + " was longer than we permit ("
                       + std::to_string(detail::kMaxStringLength) + " chars).");
    }
    return Attribute::Value{std::move(text)};
}

auto readOptions(Json& parameters) -> Expected<AttributeParameters> {
    auto options = detail::take_key(parameters, kOptionsKey);
    if (!options) {
        return std::unexpected(make_error(Error::Code::MissingParameter,
                                          "Need a list of options given via the \"options\" key."));
    }
    if (!options->is_array()) {
        return std::unexpected(make_error(Error::Code::InvalidParameter,
                                          "Need to supply a list with the \"options\" key."));
    }
    AttributeParameters result;
    for (auto const& option : *options) {
        if (!option.is_string()) {
            return std::unexpected(make_error(Error::Code::InvalidParameter,
                                              "The options need to be strings. Failed on validating: " + echo_value(option)));
        }
        result.options.push_back(option.get<std::string>());
    }
    return result;
}

auto validateOptionString(Json const& value, AttributeParameters const& parameters, BuildOptions const&)
    -> Expected<Attribute::Value> {
    if (value.is_string()) {
        auto const& text = value.get_ref<std::string const&>();
        if (std::ranges::find(parameters.options, text) != parameters.options.end()) {
            return Attribute::Value{text};
        }
    }
    return invalid("The value \"" + echo_value(value) + "\" was not among the valid options: "
                   + Json(parameters.options).dump());
}

auto validateBoolean(Json const& value, AttributeParameters const&, BuildOptions const&) -> Expected<Attribute::Value> {
    auto v = detail::parseBooleanLike(value);
    if (!v) {
        return invalid("A boolean attribute was expected, but \"" + echo_value(value) + "\" cannot be interpreted as such.");
    }
    return Attribute::Value{*v};
}

auto readIntegerBounds(Json& parameters) -> Expected<AttributeParameters> {
    return detail::readBounds(parameters, true);
}

auto readFloatBounds(Json& parameters) -> Expected<AttributeParameters> {
    return detail::readBounds(parameters, false);
}

} // namespace

void RegisterScalarAttributeTypes(AttributeTypeRegistry& registry) {
    RegisterBuiltin(registry, AttributeType::Integer, {.validate = &validateInteger});
    RegisterBuiltin(registry, AttributeType::PositiveInteger, {.validate = &validatePositiveInteger});
    RegisterBuiltin(registry, AttributeType::NonnegativeInteger, {.validate = &validateNonnegativeInteger});
    RegisterBuiltin(registry, AttributeType::BoundedInteger,
                    {.readParameters = &readIntegerBounds, .validate = &validateBoundedInteger});
    RegisterBuiltin(registry, AttributeType::Float, {.validate = &validateFloat});
    RegisterBuiltin(registry, AttributeType::PositiveFloat, {.validate = &validatePositiveFloat});
    RegisterBuiltin(registry, AttributeType::NonnegativeFloat, {.validate = &validateNonnegativeFloat});
    RegisterBuiltin(registry, AttributeType::BoundedFloat,
                    {.readParameters = &readFloatBounds, .validate = &validateBoundedFloat});
    RegisterBuiltin(registry, AttributeType::String, {.validate = &validateString});
    RegisterBuiltin(registry, AttributeType::UnrestrictedString, {.validate = &validateUnrestrictedString});
    RegisterBuiltin(registry, AttributeType::OptionString,
                    {.readParameters = &readOptions, .validate = &validateOptionString});
    RegisterBuiltin(registry, AttributeType::Boolean, {.validate = &validateBoolean});
}

} // namespace DS
