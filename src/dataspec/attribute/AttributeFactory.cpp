#include "dataspec/attribute/AttributeFactory.hpp"
#include "attribute/AttributeBuilders.hpp"
#include "attribute/AttributeTypeRegistry.hpp"
#include "json/JsonReaders.hpp"
#include "log/TaggedLogger.hpp"

#include <string>

namespace DS {
namespace {

constexpr char const* kAttributeTypeKey = "attribute_type";
constexpr char const* kValueKey         = "value";

[[nodiscard]] auto inScope(AttributeType type, AttributeScope scope) -> bool {
    return scope == AttributeScope::All || !isCompoundType(type);
}

} // namespace

auto constructAttribute(nlohmann::json const& json, BuildOptions const& options, AttributeScope scope)
    -> Expected<Attribute> {
    if (auto shape = detail::ensure_object(json, "attribute"); !shape) {
        return std::unexpected(shape.error());
    }

    // Work on a private copy; the type reads consume their keys from it.
    nlohmann::json parameters = json;

    auto typeName = detail::take_key(parameters, kAttributeTypeKey);
    if (!typeName) {
        return std::unexpected(detail::make_error(Error::Code::UnknownType,
                                                  "Need to supply an \"attribute_type\" key."));
    }
    if (!typeName->is_string()) {
        return std::unexpected(detail::make_error(Error::Code::UnknownType, kAttributeTypeKey,
                                                  "must be a string, got " + detail::echo_value(*typeName)));
    }

    auto value = detail::take_key(parameters, kValueKey);
    if (!value) {
        return std::unexpected(detail::make_error(Error::Code::MissingValue,
                                                  "Need to supply a \"value\" key, even if it is null."));
    }

    auto const& name = typeName->get_ref<std::string const&>();
    auto        view = AttributeTypeRegistry::instance().findByName(name);
    if (!view || !inScope(view->type, scope)) {
        ds_log("Unknown attribute type: " + name, "Attribute");
        return std::unexpected(detail::make_error(Error::Code::UnknownType,
                                                  "Could not locate the attribute type: " + name));
    }

    return detail::buildAttribute(*view, *value, parameters, options);
}

auto constructLeafAttribute(nlohmann::json const& json, BuildOptions const& options) -> Expected<Attribute> {
    return constructAttribute(json, options, AttributeScope::LeafOnly);
}

auto registeredAttributeTypeNames(AttributeScope scope) -> std::vector<std::string_view> {
    std::vector<std::string_view> names;
    for (auto const& entry : AttributeTypeRegistry::instance().entries()) {
        if (inScope(entry.type, scope)) {
            names.push_back(entry.type_name);
        }
    }
    return names;
}

} // namespace DS
