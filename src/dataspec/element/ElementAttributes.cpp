#include "attribute/AttributeTypeRegistry.hpp"
#include "dataspec/element/Element.hpp"
#include "dataspec/element/ElementSet.hpp"

#include <memory>

namespace DS {
namespace {

template <ElementKind Kind>
auto validateElement(nlohmann::json const& value, AttributeParameters const&, BuildOptions const& options)
    -> Expected<Attribute::Value> {
    auto element = Element::fromJson(value, Kind, options);
    if (!element) {
        return std::unexpected(element.error());
    }
    return Attribute::Value{std::make_shared<Element const>(std::move(*element))};
}

template <ElementKind Kind>
auto validateElementSet(nlohmann::json const& value, AttributeParameters const&, BuildOptions const& options)
    -> Expected<Attribute::Value> {
    auto set = ElementSet::fromJson(value, Kind, options);
    if (!set) {
        return std::unexpected(set.error());
    }
    return Attribute::Value{std::make_shared<ElementSet const>(std::move(*set))};
}

} // namespace

void RegisterElementAttributeTypes(AttributeTypeRegistry& registry) {
    RegisterBuiltin(registry, AttributeType::Observation, {.validate = &validateElement<ElementKind::Observation>});
    RegisterBuiltin(registry, AttributeType::Feature, {.validate = &validateElement<ElementKind::Feature>});
    RegisterBuiltin(registry, AttributeType::ObservationSet,
                    {.validate = &validateElementSet<ElementKind::Observation>});
    RegisterBuiltin(registry, AttributeType::FeatureSet, {.validate = &validateElementSet<ElementKind::Feature>});
}

} // namespace DS
