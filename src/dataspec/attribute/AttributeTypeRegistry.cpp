#include "attribute/AttributeTypeRegistry.hpp"

namespace DS {

auto AttributeTypeRegistry::make_view(AttributeTypeRegistry::Entry const* entry)
    -> std::optional<AttributeTypeView> {
    if (entry == nullptr) {
        return std::nullopt;
    }
    return AttributeTypeView{entry->type_name, entry->type, entry->operations};
}

AttributeTypeRegistry const& AttributeTypeRegistry::instance() {
    static AttributeTypeRegistry const registry = [] {
        AttributeTypeRegistry builtins;
        RegisterScalarAttributeTypes(builtins);
        RegisterResourceAttributeTypes(builtins);
        RegisterListAttributeTypes(builtins);
        RegisterElementAttributeTypes(builtins);
        return builtins;
    }();
    return registry;
}

bool AttributeTypeRegistry::registerType(AttributeType type, AttributeOperations operations) {
    if (operations.validate == nullptr) {
        return false;
    }
    std::string type_name{attributeTypeName(type)};
    if (by_name_.find(type_name) != by_name_.end() || by_type_.find(type) != by_type_.end()) {
        return false;
    }

    auto entry        = std::make_unique<Entry>();
    entry->type_name  = std::move(type_name);
    entry->type       = type;
    entry->operations = operations;

    auto* raw = entry.get();
    entries_.push_back(std::move(entry));
    by_name_.emplace(raw->type_name, raw);
    by_type_.emplace(type, raw);
    return true;
}

std::optional<AttributeTypeView> AttributeTypeRegistry::findByName(std::string_view type_name) const {
    auto it = by_name_.find(type_name);
    if (it == by_name_.end()) {
        return std::nullopt;
    }
    return make_view(it->second);
}

std::optional<AttributeTypeView> AttributeTypeRegistry::findByType(AttributeType type) const {
    auto it = by_type_.find(type);
    if (it == by_type_.end()) {
        return std::nullopt;
    }
    return make_view(it->second);
}

std::vector<AttributeTypeView> AttributeTypeRegistry::entries() const {
    std::vector<AttributeTypeView> views;
    views.reserve(entries_.size());
    for (auto const& entry : entries_) {
        views.push_back(AttributeTypeView{entry->type_name, entry->type, entry->operations});
    }
    return views;
}

} // namespace DS
