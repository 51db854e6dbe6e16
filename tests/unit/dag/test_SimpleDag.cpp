#include "dataspec/dag/SimpleDag.hpp"

#include <doctest/doctest.h>

#include <functional>
#include <string>
#include <vector>

using namespace DS;
using nlohmann::json;

TEST_SUITE("dag.simple_dag") {
TEST_CASE("node type names") {
    CHECK(dagNodeTypeName(DagNodeType::Operation) == "op_node");
    CHECK(dagNodeTypeName(DagNodeType::DataResource) == "data_resource_node");
    CHECK(dagNodeTypeFromName("op_node") == DagNodeType::Operation);
    CHECK_FALSE(dagNodeTypeFromName("file_node").has_value());
}

TEST_CASE("getOrCreateNode reuses nodes by id") {
    SimpleDag dag;
    auto&     op    = dag.getOrCreateNode("exec-1", DagNodeType::Operation, "DESeq2");
    auto&     input = dag.getOrCreateNode("res-1", DagNodeType::DataResource, "counts.tsv");
    CHECK(dag.size() == 2);

    auto& again = dag.getOrCreateNode("exec-1", DagNodeType::Operation);
    CHECK(&again == &op);
    CHECK(again.name() == "DESeq2");
    CHECK(dag.size() == 2);

    CHECK(op.addParent(input));
    CHECK_FALSE(op.addParent(input));
    CHECK(op.parentIds() == std::vector<std::string>{"res-1"});
}

TEST_CASE("serialization") {
    SimpleDag dag;
    auto&     output = dag.getOrCreateNode("res-2", DagNodeType::DataResource, "results.tsv");
    auto&     op     = dag.getOrCreateNode("exec-1", DagNodeType::Operation, "DESeq2");
    op.setData(json{{"operation_id", "op-1"}});
    output.addParent(op);

    auto const serialized = dag.serialize();
    REQUIRE(serialized.is_array());
    REQUIRE(serialized.size() == 2);
    CHECK(serialized[0] == json{{"id", "res-2"},
                                {"node_type", "data_resource_node"},
                                {"node_name", "results.tsv"},
                                {"parentIds", json::array({"exec-1"})},
                                {"data", nullptr}});
    CHECK(serialized[1]["data"]["operation_id"] == "op-1");
    CHECK(serialized[1]["parentIds"] == json::array());
}

TEST_CASE("node identity is id and type") {
    DagNode a{"x", DagNodeType::Operation, "first"};
    DagNode b{"x", DagNodeType::Operation, "second"};
    DagNode c{"x", DagNodeType::DataResource};
    CHECK(a == b);
    CHECK_FALSE(a == c);
    CHECK(std::hash<DagNode>{}(a) == std::hash<DagNode>{}(b));

    SimpleDag dag;
    CHECK(dag.addNode(a));
    CHECK_FALSE(dag.addNode(b));
    CHECK(dag.addNode(c));
    CHECK(dag.contains(b));
    CHECK(dag.find("x") != nullptr);
    CHECK(dag.find("y") == nullptr);
}
}
