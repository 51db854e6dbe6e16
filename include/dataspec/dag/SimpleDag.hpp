#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace DS {

enum class DagNodeType {
    Operation,
    DataResource
};

// "op_node" / "data_resource_node".
[[nodiscard]] auto dagNodeTypeName(DagNodeType type) -> std::string_view;
[[nodiscard]] auto dagNodeTypeFromName(std::string_view name) -> std::optional<DagNodeType>;

/**
 * A node of the lineage graph linking executed operations with the data
 * resources they consumed and produced. Identity is the (id, type) pair.
 */
class DagNode {
public:
    DagNode(std::string id, DagNodeType type, std::string name = {}, nlohmann::json data = nullptr)
        : id_(std::move(id)), type_(type), name_(std::move(name)), data_(std::move(data)) {}

    [[nodiscard]] auto id() const -> std::string const& { return this->id_; }
    [[nodiscard]] auto type() const -> DagNodeType { return this->type_; }
    [[nodiscard]] auto name() const -> std::string const& { return this->name_; }
    [[nodiscard]] auto data() const -> nlohmann::json const& { return this->data_; }
    [[nodiscard]] auto parentIds() const -> std::vector<std::string>;

    // Returns false when `parent` was already recorded.
    auto addParent(DagNode const& parent) -> bool;
    auto setData(nlohmann::json data) -> void { this->data_ = std::move(data); }

    // {"id", "node_type", "node_name", "parentIds", "data"}
    [[nodiscard]] auto serialize() const -> nlohmann::json;

    auto operator==(DagNode const& other) const -> bool { return this->id_ == other.id_ && this->type_ == other.type_; }

private:
    struct ParentKey {
        std::string id;
        DagNodeType type;
        auto        operator==(ParentKey const&) const -> bool = default;
    };

    std::string            id_;
    DagNodeType            type_;
    std::string            name_;
    nlohmann::json         data_;
    std::vector<ParentKey> parents_;
};

class SimpleDag {
public:
    // Returns false when an equal node is already part of the graph.
    auto addNode(DagNode node) -> bool;

    // Looks the node up by id alone; a new node gets the given type and name.
    auto getOrCreateNode(std::string const& id, DagNodeType type, std::string const& name = {}) -> DagNode&;

    [[nodiscard]] auto find(std::string_view id) const -> DagNode const*;
    [[nodiscard]] auto contains(DagNode const& node) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t { return this->nodes_.size(); }

    [[nodiscard]] auto serialize() const -> nlohmann::json;

private:
    // Nodes stay at a fixed address so getOrCreateNode can hand out references.
    std::vector<std::unique_ptr<DagNode>> nodes_;
};

} // namespace DS

template <>
struct std::hash<DS::DagNode> {
    auto operator()(DS::DagNode const& node) const noexcept -> std::size_t {
        auto const seed = std::hash<std::string>{}(node.id());
        return seed ^ (std::hash<int>{}(static_cast<int>(node.type())) + 0x9e3779b9 + (seed << 6) + (seed >> 2));
    }
};
