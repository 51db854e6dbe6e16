#include "dataspec/element/Element.hpp"
#include "dataspec/attribute/AttributeFactory.hpp"
#include "json/JsonReaders.hpp"

#include <string>

namespace DS {
namespace {

using Json = nlohmann::json;

constexpr char const* kIdKey         = "id";
constexpr char const* kAttributesKey = "attributes";

[[nodiscard]] auto nestedOptions(BuildOptions const& options) -> BuildOptions {
    return BuildOptions{.allowNull            = options.permitNullAttributes,
                        .ignoreExtraKeys      = options.ignoreExtraKeys,
                        .permitNullAttributes = options.permitNullAttributes};
}

// The id obeys the same rules (and normalization) as a String attribute.
[[nodiscard]] auto readIdentifier(Json const& raw) -> Expected<std::string> {
    auto id = constructLeafAttribute(Json{{"attribute_type", "String"}, {"value", raw}});
    if (!id) {
        return std::unexpected(prefixError(id.error(), kIdKey));
    }
    return std::string(*id->asString());
}

} // namespace

auto elementKindName(ElementKind kind) -> std::string_view {
    switch (kind) {
    case ElementKind::Observation:
        return "Observation";
    case ElementKind::Feature:
        return "Feature";
    }
    return "Element";
}

auto Element::fromJson(nlohmann::json const& json, ElementKind kind, BuildOptions const& options) -> Expected<Element> {
    if (!json.is_object()) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput,
                                                  std::string("The constructor for an ") + std::string(elementKindName(kind))
                                                      + " expects an object."));
    }

    Json remaining = json;
    auto rawId     = detail::take_key(remaining, kIdKey);
    if (!rawId) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput,
                                                  std::string("An ") + std::string(elementKindName(kind))
                                                      + " requires an \"id\" key."));
    }
    auto id = readIdentifier(*rawId);
    if (!id) {
        return std::unexpected(id.error());
    }

    auto rawAttributes = detail::take_key(remaining, kAttributesKey).value_or(Json::object());
    if (!rawAttributes.is_object()) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput, kAttributesKey,
                                                  "must map attribute names to attribute objects"));
    }

    if (!remaining.empty() && !options.ignoreExtraKeys) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput,
                                                  "Received extra key(s) for " + *id + ": "
                                                      + detail::join_keys(detail::object_keys(remaining))));
    }

    Element element{kind, std::move(*id), {}, options.permitNullAttributes};
    auto const nested = nestedOptions(options);
    for (auto it = rawAttributes.begin(); it != rawAttributes.end(); ++it) {
        auto attribute = constructLeafAttribute(it.value(), nested);
        if (!attribute) {
            return std::unexpected(prefixError(attribute.error(), it.key()));
        }
        element.attributes_.insert_or_assign(it.key(), std::move(*attribute));
    }
    return element;
}

auto Element::attribute(std::string_view name) const -> Attribute const* {
    auto it = this->attributes_.find(name);
    return it == this->attributes_.end() ? nullptr : &it->second;
}

auto Element::addAttribute(std::string const& name, nlohmann::json const& json, bool overwrite) -> Expected<void> {
    if (!overwrite && this->attributes_.contains(name)) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput,
                                                  "The attribute identifier " + name
                                                      + " already existed and overwriting was blocked."));
    }
    auto attribute = constructLeafAttribute(json, BuildOptions{.allowNull = this->permitNullAttributes_});
    if (!attribute) {
        return std::unexpected(prefixError(attribute.error(), name));
    }
    this->attributes_.insert_or_assign(name, std::move(*attribute));
    return {};
}

auto Element::toJson() const -> nlohmann::json {
    Json attributes = Json::object();
    for (auto const& [name, attribute] : this->attributes_) {
        attributes[name] = attribute.toJson();
    }
    return Json{{kIdKey, this->id_}, {kAttributesKey, std::move(attributes)}};
}

} // namespace DS
