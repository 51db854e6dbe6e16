#pragma once
#include "dataspec/attribute/AttributeType.hpp"
#include "dataspec/attribute/FloatValue.hpp"
#include "dataspec/core/BuildOptions.hpp"
#include "dataspec/core/Error.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace DS {

class AttributeList;
class Element;
class ElementSet;

namespace detail {
struct AttributeBuilder;
} // namespace detail

// Bounds keep the JSON number kind they were written with so serialization is faithful.
using NumericBound = std::variant<std::int64_t, double>;

struct ResourceReference {
    std::vector<std::string> ids;
    bool                     submittedAsList = false;

    auto operator==(ResourceReference const&) const -> bool = default;
};

struct AttributeParameters {
    std::optional<NumericBound> min;
    std::optional<NumericBound> max;
    std::vector<std::string>    options;
    std::optional<bool>         many;
    std::optional<std::string>  resourceType;
    std::vector<std::string>    resourceTypes;

    auto operator==(AttributeParameters const&) const -> bool = default;
};

/**
 * A validated, immutable attribute value.
 *
 * Instances only come out of the attribute factory (constructAttribute,
 * constructLeafAttribute, Attribute::fromJson) so every Attribute satisfies
 * the rules of its type: construction either fully succeeds or yields an Error.
 *
 * Compound payloads (lists, Elements, ElementSets) are held through shared
 * pointers to const, so copies are cheap and never alias mutable state.
 */
class Attribute {
public:
    using Value = std::variant<std::monostate,
                               std::int64_t,
                               FloatValue,
                               std::string,
                               bool,
                               ResourceReference,
                               std::shared_ptr<AttributeList const>,
                               std::shared_ptr<Element const>,
                               std::shared_ptr<ElementSet const>>;

    [[nodiscard]] static auto fromJson(nlohmann::json const& json, BuildOptions const& options = {}) -> Expected<Attribute>;

    [[nodiscard]] auto type() const -> AttributeType { return this->type_; }
    [[nodiscard]] auto typeName() const -> std::string_view { return attributeTypeName(this->type_); }
    [[nodiscard]] auto allowsNull() const -> bool { return this->allowNull_; }
    [[nodiscard]] auto isNull() const -> bool { return std::holds_alternative<std::monostate>(this->value_); }
    [[nodiscard]] auto value() const -> Value const& { return this->value_; }
    [[nodiscard]] auto parameters() const -> AttributeParameters const& { return this->parameters_; }

    [[nodiscard]] auto asInteger() const -> std::optional<std::int64_t>;
    [[nodiscard]] auto asFloat() const -> std::optional<FloatValue>;
    [[nodiscard]] auto asString() const -> std::optional<std::string_view>;
    [[nodiscard]] auto asBoolean() const -> std::optional<bool>;
    [[nodiscard]] auto resources() const -> ResourceReference const*;
    [[nodiscard]] auto list() const -> AttributeList const*;
    [[nodiscard]] auto element() const -> Element const*;
    [[nodiscard]] auto elementSet() const -> ElementSet const*;

    /**
     * Checks the declared resource type(s) against the caller's vocabulary.
     * Fails with InvalidResourceType naming every entry outside `available`,
     * or NotSupported when this is not a resource attribute.
     */
    [[nodiscard]] auto checkResourceTypeKeys(std::set<std::string> const& available) const -> Expected<void>;

    // {"attribute_type": ..., "value": ..., <type parameters>...}
    [[nodiscard]] auto toJson() const -> nlohmann::json;
    // Only the "value" part of toJson().
    [[nodiscard]] auto valueToJson() const -> nlohmann::json;

    auto operator==(Attribute const& other) const -> bool;

private:
    friend struct detail::AttributeBuilder;

    Attribute(AttributeType type, Value value, AttributeParameters parameters, bool allowNull)
        : type_(type), value_(std::move(value)), parameters_(std::move(parameters)), allowNull_(allowNull) {}

    AttributeType       type_;
    Value               value_;
    AttributeParameters parameters_;
    bool                allowNull_ = false;
};

} // namespace DS
