#pragma once
#include "dataspec/attribute/Attribute.hpp"
#include "dataspec/core/BuildOptions.hpp"
#include "dataspec/core/Error.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace DS {

enum class ElementKind {
    // A sample.
    Observation,
    // A measured variable, e.g. a gene.
    Feature
};

[[nodiscard]] auto elementKindName(ElementKind kind) -> std::string_view;

/**
 * An identified bundle of named leaf attributes.
 *
 * JSON form: {"id": <identifier>, "attributes": {<name>: AttributeJSON, ...}}.
 * Equality and hashing look at the id only, so two Elements carrying the same
 * id are the same Element whatever their attributes say.
 */
class Element {
public:
    using AttributeMap = std::map<std::string, Attribute, std::less<>>;

    /**
     * Builds an Element. "id" goes through the String attribute rules,
     * "attributes" is optional and each entry is built with the leaf-only
     * factory. Nested nulls are accepted only with options.permitNullAttributes.
     */
    [[nodiscard]] static auto fromJson(nlohmann::json const& json, ElementKind kind, BuildOptions const& options = {})
        -> Expected<Element>;

    [[nodiscard]] auto kind() const -> ElementKind { return this->kind_; }
    [[nodiscard]] auto id() const -> std::string const& { return this->id_; }
    [[nodiscard]] auto attributes() const -> AttributeMap const& { return this->attributes_; }
    [[nodiscard]] auto attribute(std::string_view name) const -> Attribute const*;

    /**
     * Validates `json` as a leaf attribute and stores it under `name`.
     * An existing name fails with MalformedInput unless `overwrite` is set.
     */
    auto addAttribute(std::string const& name, nlohmann::json const& json, bool overwrite = false) -> Expected<void>;

    // Payload comparison; operator== only looks at the id.
    [[nodiscard]] auto sameAttributes(Element const& other) const -> bool {
        return this->attributes_ == other.attributes_;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    auto operator==(Element const& other) const -> bool { return this->id_ == other.id_; }

private:
    friend class ElementSet;

    Element(ElementKind kind, std::string id, AttributeMap attributes, bool permitNullAttributes)
        : kind_(kind), id_(std::move(id)), attributes_(std::move(attributes)), permitNullAttributes_(permitNullAttributes) {}

    ElementKind  kind_;
    std::string  id_;
    AttributeMap attributes_;
    bool         permitNullAttributes_ = false;
};

} // namespace DS

template <>
struct std::hash<DS::Element> {
    auto operator()(DS::Element const& element) const noexcept -> std::size_t {
        return std::hash<std::string>{}(element.id());
    }
};
