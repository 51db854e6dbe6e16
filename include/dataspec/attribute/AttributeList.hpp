#pragma once
#include "dataspec/attribute/Attribute.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace DS {

// Homogeneous sequence of leaf attributes sharing the parameters of the owning list.
class AttributeList {
public:
    AttributeList(AttributeType itemType, std::vector<Attribute> items)
        : itemType_(itemType), items_(std::move(items)) {}

    [[nodiscard]] auto itemType() const -> AttributeType { return this->itemType_; }
    [[nodiscard]] auto items() const -> std::vector<Attribute> const& { return this->items_; }
    [[nodiscard]] auto size() const -> std::size_t { return this->items_.size(); }
    [[nodiscard]] auto empty() const -> bool { return this->items_.empty(); }
    [[nodiscard]] auto at(std::size_t index) const -> Attribute const& { return this->items_.at(index); }

    auto begin() const { return this->items_.begin(); }
    auto end() const { return this->items_.end(); }

    auto operator==(AttributeList const& other) const -> bool {
        return this->itemType_ == other.itemType_ && this->items_ == other.items_;
    }

private:
    AttributeType          itemType_;
    std::vector<Attribute> items_;
};

} // namespace DS
