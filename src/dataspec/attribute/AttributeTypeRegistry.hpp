#pragma once

#include "dataspec/attribute/Attribute.hpp"
#include "dataspec/attribute/AttributeType.hpp"
#include "dataspec/core/BuildOptions.hpp"
#include "dataspec/core/Error.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace DS {

struct AttributeOperations {
    // Consumes the type-specific keys it understands from `parameters`.
    using ReadParametersFn = Expected<AttributeParameters> (*)(nlohmann::json& parameters);
    // Validates a non-null value.
    using ValidateFn = Expected<Attribute::Value> (*)(nlohmann::json const&       value,
                                                      AttributeParameters const& parameters,
                                                      BuildOptions const&        options);

    ReadParametersFn readParameters = nullptr;
    ValidateFn       validate       = nullptr;
};

struct AttributeTypeView {
    std::string_view           type_name;
    AttributeType              type;
    AttributeOperations const& operations;
};

/**
 * Process-wide table from "attribute_type" names to their operations.
 * Filled once on first use and read-only afterwards, so lookups need no locking.
 */
class AttributeTypeRegistry {
public:
    static AttributeTypeRegistry const& instance();

    [[nodiscard]] bool registerType(AttributeType type, AttributeOperations operations);

    [[nodiscard]] std::optional<AttributeTypeView> findByName(std::string_view type_name) const;
    [[nodiscard]] std::optional<AttributeTypeView> findByType(AttributeType type) const;
    [[nodiscard]] std::vector<AttributeTypeView>   entries() const;

private:
    AttributeTypeRegistry() = default;

    struct Entry {
        std::string         type_name;
        AttributeType       type;
        AttributeOperations operations;
    };

    static auto make_view(Entry const* entry) -> std::optional<AttributeTypeView>;

    struct TypeNameHash {
        using is_transparent = void;
        auto operator()(std::string_view value) const noexcept -> std::size_t {
            return std::hash<std::string_view>{}(value);
        }
    };

    struct TypeNameEqual {
        using is_transparent = void;
        auto operator()(std::string_view lhs, std::string_view rhs) const noexcept -> bool {
            return lhs == rhs;
        }
    };

    std::vector<std::unique_ptr<Entry>>                                  entries_;
    std::unordered_map<std::string, Entry*, TypeNameHash, TypeNameEqual> by_name_;
    std::unordered_map<AttributeType, Entry*>                            by_type_;
};

inline void RegisterBuiltin(AttributeTypeRegistry& registry, AttributeType type, AttributeOperations operations) {
    [[maybe_unused]] bool registered = registry.registerType(type, operations);
    (void)registered;
}

void RegisterScalarAttributeTypes(AttributeTypeRegistry& registry);
void RegisterResourceAttributeTypes(AttributeTypeRegistry& registry);
void RegisterListAttributeTypes(AttributeTypeRegistry& registry);
void RegisterElementAttributeTypes(AttributeTypeRegistry& registry);

} // namespace DS
