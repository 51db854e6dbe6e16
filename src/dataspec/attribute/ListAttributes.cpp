#include "attribute/AttributeBuilders.hpp"
#include "attribute/AttributeTypeRegistry.hpp"
#include "dataspec/attribute/AttributeList.hpp"
#include "json/JsonReaders.hpp"

#include <memory>
#include <string>
#include <vector>

namespace DS {
namespace {

using detail::echo_value;
using detail::make_error;
using Json = nlohmann::json;

[[nodiscard]] constexpr auto itemTypeOf(AttributeType listType) -> AttributeType {
    switch (listType) {
    case AttributeType::StringList:
        return AttributeType::String;
    case AttributeType::UnrestrictedStringList:
        return AttributeType::UnrestrictedString;
    case AttributeType::BoundedIntegerList:
        return AttributeType::BoundedInteger;
    case AttributeType::BoundedFloatList:
        return AttributeType::BoundedFloat;
    default:
        return listType;
    }
}

/*
 * Every item goes through the validator of the item type with the parameters
 * of the list, so one min/max pair covers the whole sequence.
 */
template <AttributeType ListType>
auto validateList(Json const& value, AttributeParameters const& parameters, BuildOptions const& options)
    -> Expected<Attribute::Value> {
    constexpr AttributeType itemType = itemTypeOf(ListType);
    if (!value.is_array()) {
        return std::unexpected(make_error(Error::Code::MalformedInput,
                                          std::string("A ") + std::string(attributeTypeName(ListType))
                                              + " expects a list of values. Received: " + echo_value(value)));
    }

    auto item = AttributeTypeRegistry::instance().findByType(itemType);
    if (!item) {
        return std::unexpected(make_error(Error::Code::UnknownType, attributeTypeName(itemType)));
    }

    std::vector<Attribute> items;
    items.reserve(value.size());
    for (std::size_t index = 0; index < value.size(); ++index) {
        auto const& raw = value[index];
        auto const  key = "[" + std::to_string(index) + "]";
        if (raw.is_null()) {
            return std::unexpected(make_error(Error::Code::NullValue, key, "list entries cannot be null"));
        }
        auto validated = item->operations.validate(raw, parameters, options);
        if (!validated) {
            return std::unexpected(prefixError(validated.error(), key));
        }
        items.push_back(detail::AttributeBuilder::make(itemType, std::move(*validated), parameters, false));
    }
    return Attribute::Value{std::make_shared<AttributeList const>(itemType, std::move(items))};
}

auto readIntegerBounds(Json& parameters) -> Expected<AttributeParameters> {
    return detail::readBounds(parameters, true);
}

auto readFloatBounds(Json& parameters) -> Expected<AttributeParameters> {
    return detail::readBounds(parameters, false);
}

} // namespace

void RegisterListAttributeTypes(AttributeTypeRegistry& registry) {
    RegisterBuiltin(registry, AttributeType::StringList,
                    {.validate = &validateList<AttributeType::StringList>});
    RegisterBuiltin(registry, AttributeType::UnrestrictedStringList,
                    {.validate = &validateList<AttributeType::UnrestrictedStringList>});
    RegisterBuiltin(registry, AttributeType::BoundedIntegerList,
                    {.readParameters = &readIntegerBounds, .validate = &validateList<AttributeType::BoundedIntegerList>});
    RegisterBuiltin(registry, AttributeType::BoundedFloatList,
                    {.readParameters = &readFloatBounds, .validate = &validateList<AttributeType::BoundedFloatList>});
}

} // namespace DS
