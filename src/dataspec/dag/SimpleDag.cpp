#include "dataspec/dag/SimpleDag.hpp"

#include <algorithm>

namespace DS {

auto dagNodeTypeName(DagNodeType type) -> std::string_view {
    switch (type) {
    case DagNodeType::Operation:
        return "op_node";
    case DagNodeType::DataResource:
        return "data_resource_node";
    }
    return "unknown";
}

auto dagNodeTypeFromName(std::string_view name) -> std::optional<DagNodeType> {
    for (auto type : {DagNodeType::Operation, DagNodeType::DataResource}) {
        if (dagNodeTypeName(type) == name)
            return type;
    }
    return std::nullopt;
}

auto DagNode::parentIds() const -> std::vector<std::string> {
    std::vector<std::string> ids;
    ids.reserve(this->parents_.size());
    for (auto const& parent : this->parents_) {
        ids.push_back(parent.id);
    }
    return ids;
}

auto DagNode::addParent(DagNode const& parent) -> bool {
    ParentKey key{parent.id(), parent.type()};
    if (std::ranges::find(this->parents_, key) != this->parents_.end()) {
        return false;
    }
    this->parents_.push_back(std::move(key));
    return true;
}

auto DagNode::serialize() const -> nlohmann::json {
    return nlohmann::json{{"id", this->id_},
                          {"node_type", std::string(dagNodeTypeName(this->type_))},
                          {"node_name", this->name_},
                          {"parentIds", this->parentIds()},
                          {"data", this->data_}};
}

auto SimpleDag::addNode(DagNode node) -> bool {
    if (this->contains(node)) {
        return false;
    }
    this->nodes_.push_back(std::make_unique<DagNode>(std::move(node)));
    return true;
}

auto SimpleDag::getOrCreateNode(std::string const& id, DagNodeType type, std::string const& name) -> DagNode& {
    for (auto& node : this->nodes_) {
        if (node->id() == id) {
            return *node;
        }
    }
    this->nodes_.push_back(std::make_unique<DagNode>(id, type, name));
    return *this->nodes_.back();
}

auto SimpleDag::find(std::string_view id) const -> DagNode const* {
    for (auto const& node : this->nodes_) {
        if (node->id() == id) {
            return node.get();
        }
    }
    return nullptr;
}

auto SimpleDag::contains(DagNode const& node) const -> bool {
    return std::ranges::any_of(this->nodes_, [&node](auto const& held) { return *held == node; });
}

auto SimpleDag::serialize() const -> nlohmann::json {
    auto nodes = nlohmann::json::array();
    for (auto const& node : this->nodes_) {
        nodes.push_back(node->serialize());
    }
    return nodes;
}

} // namespace DS
