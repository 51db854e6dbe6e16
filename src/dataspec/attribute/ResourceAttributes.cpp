#include "attribute/AttributeBuilders.hpp"
#include "attribute/AttributeTypeRegistry.hpp"
#include "core/Validation.hpp"
#include "json/JsonReaders.hpp"

#include <string>

namespace DS {
namespace {

using detail::echo_value;
using detail::make_error;
using Json = nlohmann::json;

constexpr char const* kManyKey          = "many";
constexpr char const* kResourceTypeKey  = "resource_type";
constexpr char const* kResourceTypesKey = "resource_types";

[[nodiscard]] auto readMany(Json& parameters) -> Expected<bool> {
    auto many = detail::take_key(parameters, kManyKey);
    if (!many) {
        return std::unexpected(make_error(Error::Code::MissingParameter, "You must specify a \"many\" key."));
    }
    auto flag = detail::parseBooleanLike(*many);
    if (!flag) {
        return std::unexpected(make_error(Error::Code::InvalidParameter, kManyKey,
                                          "\"" + echo_value(*many) + "\" cannot be interpreted as a boolean."));
    }
    return *flag;
}

auto readSingleTypeParameters(Json& parameters) -> Expected<AttributeParameters> {
    auto many = readMany(parameters);
    if (!many) {
        return std::unexpected(many.error());
    }
    auto resourceType = detail::take_key(parameters, kResourceTypeKey);
    if (!resourceType) {
        return std::unexpected(make_error(Error::Code::MissingParameter,
                                          "You must specify a \"resource_type\" key."));
    }
    if (!resourceType->is_string()) {
        return std::unexpected(make_error(Error::Code::InvalidParameter, kResourceTypeKey, "must be a string"));
    }
    AttributeParameters result;
    result.many         = *many;
    result.resourceType = resourceType->get<std::string>();
    return result;
}

auto readVariableTypeParameters(Json& parameters) -> Expected<AttributeParameters> {
    auto many = readMany(parameters);
    if (!many) {
        return std::unexpected(many.error());
    }
    auto resourceTypes = detail::take_key(parameters, kResourceTypesKey);
    if (!resourceTypes) {
        return std::unexpected(make_error(Error::Code::MissingParameter,
                                          "You must specify a \"resource_types\" key."));
    }
    if (!resourceTypes->is_array() || resourceTypes->empty()) {
        return std::unexpected(make_error(Error::Code::InvalidParameter, kResourceTypesKey,
                                          "The resource_types keyword requires a non-empty list."));
    }
    AttributeParameters result;
    result.many = *many;
    for (auto const& entry : *resourceTypes) {
        if (!entry.is_string()) {
            return std::unexpected(make_error(Error::Code::InvalidParameter, kResourceTypesKey,
                                              "entries must be strings. Failed on: " + echo_value(entry)));
        }
        result.resourceTypes.push_back(entry.get<std::string>());
    }
    return result;
}

auto validateResourceReference(Json const& value, AttributeParameters const& parameters, BuildOptions const&)
    -> Expected<Attribute::Value> {
    ResourceReference reference;
    if (value.is_string()) {
        reference.ids.push_back(value.get<std::string>());
    } else if (value.is_array()) {
        if (!parameters.many.value_or(false) && value.size() > 1) {
            return std::unexpected(make_error(Error::Code::InvalidValue,
                                              "The values (" + echo_value(value)
                                                  + ") are inconsistent with the many=false parameter."));
        }
        reference.submittedAsList = true;
        for (auto const& entry : value) {
            if (!entry.is_string()) {
                return std::unexpected(make_error(Error::Code::InvalidValue,
                                                  "The passed value (" + echo_value(entry) + ") was not a valid UUID."));
            }
            reference.ids.push_back(entry.get<std::string>());
        }
    } else {
        return std::unexpected(make_error(Error::Code::InvalidValue,
                                          "Value needs to be either a single UUID or a list of UUIDs."));
    }

    for (auto const& id : reference.ids) {
        if (!detail::canonicalUuid(id)) {
            return std::unexpected(make_error(Error::Code::InvalidValue,
                                              "The passed value (" + id + ") was not a valid UUID."));
        }
    }
    return Attribute::Value{std::move(reference)};
}

} // namespace

void RegisterResourceAttributeTypes(AttributeTypeRegistry& registry) {
    RegisterBuiltin(registry, AttributeType::DataResource,
                    {.readParameters = &readSingleTypeParameters, .validate = &validateResourceReference});
    RegisterBuiltin(registry, AttributeType::OperationDataResource,
                    {.readParameters = &readSingleTypeParameters, .validate = &validateResourceReference});
    RegisterBuiltin(registry, AttributeType::VariableDataResource,
                    {.readParameters = &readVariableTypeParameters, .validate = &validateResourceReference});
}

} // namespace DS
