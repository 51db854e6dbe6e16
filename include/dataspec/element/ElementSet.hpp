#pragma once
#include "dataspec/core/BuildOptions.hpp"
#include "dataspec/core/Error.hpp"
#include "dataspec/element/Element.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <parallel_hashmap/phmap.h>

namespace DS {

/**
 * A collection of Elements of one kind, unique by id.
 *
 * Unlike a plain set, adding an Element whose id is already present is an
 * error rather than a no-op, at construction and through add().
 *
 * JSON form: {"multiple": <bool, default true>, "elements": [ElementJSON, ...]}.
 * A set built with "multiple": false is a singleton and holds at most one Element.
 *
 * The set algebra keeps the element order of the left operand followed by
 * elements that only the right operand contributes. Operands of different
 * kinds fail with TypeMismatch.
 */
class ElementSet {
public:
    explicit ElementSet(ElementKind kind, bool singleton = false)
        : kind_(kind), singleton_(singleton) {}

    [[nodiscard]] static auto fromJson(nlohmann::json const& json, ElementKind kind, BuildOptions const& options = {})
        -> Expected<ElementSet>;

    [[nodiscard]] static auto create(ElementKind kind, std::vector<Element> elements, bool singleton = false)
        -> Expected<ElementSet>;

    [[nodiscard]] auto kind() const -> ElementKind { return this->kind_; }
    [[nodiscard]] auto isSingleton() const -> bool { return this->singleton_; }
    [[nodiscard]] auto size() const -> std::size_t { return this->elements_.size(); }
    [[nodiscard]] auto empty() const -> bool { return this->elements_.empty(); }
    [[nodiscard]] auto elements() const -> std::vector<Element> const& { return this->elements_; }
    [[nodiscard]] auto contains(std::string_view id) const -> bool;
    [[nodiscard]] auto find(std::string_view id) const -> Element const*;

    auto add(Element element) -> Expected<void>;

    /**
     * Elements present in both sets, with merged attribute maps. A name set on
     * both sides with different values is a Conflict naming the attribute.
     */
    [[nodiscard]] auto intersect(ElementSet const& other) const -> Expected<std::vector<Element>>;
    // Intersection merge for shared ids; everything else passes through unchanged.
    [[nodiscard]] auto unite(ElementSet const& other) const -> Expected<std::vector<Element>>;
    [[nodiscard]] auto difference(ElementSet const& other, DifferenceOptions const& options = {}) const
        -> Expected<std::vector<Element>>;

    [[nodiscard]] auto setIntersection(ElementSet const& other) const -> Expected<ElementSet>;
    [[nodiscard]] auto setUnion(ElementSet const& other) const -> Expected<ElementSet>;
    [[nodiscard]] auto setDifference(ElementSet const& other) const -> Expected<ElementSet>;

    [[nodiscard]] auto isEquivalentTo(ElementSet const& other) const -> bool { return *this == other; }
    [[nodiscard]] auto isSubsetOf(ElementSet const& other) const -> bool;
    [[nodiscard]] auto isProperSubsetOf(ElementSet const& other) const -> bool;
    [[nodiscard]] auto isProperSupersetOf(ElementSet const& other) const -> bool;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] auto hash() const -> std::size_t;

    // Same kind, same singleton flag and the same ids; attributes are not compared.
    auto operator==(ElementSet const& other) const -> bool;

private:
    [[nodiscard]] auto sameKindAs(ElementSet const& other, std::string_view operation) const -> Expected<void>;
    [[nodiscard]] auto merged(Element const& left, Element const& right) const -> Expected<Element>;
    [[nodiscard]] auto collect(Expected<std::vector<Element>> elements) const -> Expected<ElementSet>;

    ElementKind                                  kind_;
    bool                                         singleton_ = false;
    std::vector<Element>                         elements_;
    phmap::flat_hash_map<std::string, std::size_t> index_;
};

} // namespace DS

template <>
struct std::hash<DS::ElementSet> {
    auto operator()(DS::ElementSet const& set) const -> std::size_t {
        return set.hash();
    }
};
