#include "dataspec/attribute/AttributeFactory.hpp"

#include <doctest/doctest.h>

#include <set>
#include <string>

using namespace DS;
using nlohmann::json;

namespace {

constexpr char const* kFirst  = "3b4f2a10-8c5e-4a8e-9f0d-0c1f4e9a2b71";
constexpr char const* kSecond = "d2f6c1a7-5e4b-4f3a-8b2c-9e1d0a7f6c53";

auto resource(json value, bool many, std::string type = "DataResource") {
    json raw{{"attribute_type", type}, {"value", std::move(value)}, {"many", many}};
    if (type == "VariableDataResource") {
        raw["resource_types"] = {"MTX", "I_MTX"};
    } else {
        raw["resource_type"] = "MTX";
    }
    return constructAttribute(raw);
}

} // namespace

TEST_SUITE("attribute.resource") {
TEST_CASE("single UUID") {
    auto attribute = resource(kFirst, false);
    REQUIRE(attribute.has_value());
    REQUIRE(attribute->resources() != nullptr);
    CHECK(attribute->resources()->ids == std::vector<std::string>{kFirst});
    CHECK(attribute->toJson()
          == json{{"attribute_type", "DataResource"}, {"value", kFirst}, {"many", false}, {"resource_type", "MTX"}});
}

TEST_CASE("lists honour the many flag") {
    CHECK(resource(json{kFirst, kSecond}, true).has_value());
    CHECK(resource(json::array({kFirst}), false).has_value());
    CHECK(resource(json::array(), false).has_value());

    auto tooMany = resource(json{kFirst, kSecond}, false);
    REQUIRE_FALSE(tooMany.has_value());
    CHECK(tooMany.error().code == Error::Code::InvalidValue);

    auto listed = resource(json{kFirst, kSecond}, true);
    CHECK(listed->valueToJson() == json{kFirst, kSecond});
}

TEST_CASE("values must be UUIDs") {
    CHECK(resource("not-a-uuid", false).error().code == Error::Code::InvalidValue);
    CHECK(resource(json{kFirst, "nope"}, true).error().code == Error::Code::InvalidValue);
    CHECK(resource(json{kFirst, 5}, true).error().code == Error::Code::InvalidValue);
    CHECK(resource(17, false).error().code == Error::Code::InvalidValue);
}

TEST_CASE("resource parameters") {
    auto noMany = constructAttribute(json{{"attribute_type", "DataResource"}, {"value", kFirst}, {"resource_type", "MTX"}});
    CHECK(noMany.error().code == Error::Code::MissingParameter);

    auto badMany = constructAttribute(
            json{{"attribute_type", "DataResource"}, {"value", kFirst}, {"many", "maybe"}, {"resource_type", "MTX"}});
    CHECK(badMany.error().code == Error::Code::InvalidParameter);

    auto noType = constructAttribute(json{{"attribute_type", "DataResource"}, {"value", kFirst}, {"many", false}});
    CHECK(noType.error().code == Error::Code::MissingParameter);

    auto emptyTypes = constructAttribute(json{{"attribute_type", "VariableDataResource"},
                                              {"value", kFirst},
                                              {"many", false},
                                              {"resource_types", json::array()}});
    CHECK(emptyTypes.error().code == Error::Code::InvalidParameter);

    auto manyAsText = constructAttribute(
            json{{"attribute_type", "DataResource"}, {"value", kFirst}, {"many", "true"}, {"resource_type", "MTX"}});
    REQUIRE(manyAsText.has_value());
    CHECK(manyAsText->parameters().many == true);
}

TEST_CASE("resource types are checked against the caller's vocabulary") {
    std::set<std::string> const vocabulary{"MTX", "I_MTX", "ANN"};

    auto single = resource(kFirst, false);
    REQUIRE(single.has_value());
    CHECK(single->checkResourceTypeKeys(vocabulary).has_value());

    auto variable = resource(kFirst, false, "VariableDataResource");
    REQUIRE(variable.has_value());
    CHECK(variable->checkResourceTypeKeys(vocabulary).has_value());

    auto narrow = variable->checkResourceTypeKeys({"MTX"});
    REQUIRE_FALSE(narrow.has_value());
    CHECK(narrow.error().code == Error::Code::InvalidResourceType);
    CHECK(narrow.error().message->find("I_MTX") != std::string::npos);

    auto integer = constructAttribute(json{{"attribute_type", "Integer"}, {"value", 1}});
    REQUIRE(integer.has_value());
    CHECK(integer->checkResourceTypeKeys(vocabulary).error().code == Error::Code::NotSupported);
}

TEST_CASE("OperationDataResource shares the rules under its own tag") {
    auto attribute = resource(kFirst, false, "OperationDataResource");
    REQUIRE(attribute.has_value());
    CHECK(attribute->type() == AttributeType::OperationDataResource);
    CHECK(isResourceType(attribute->type()));
    CHECK_FALSE(isUserResourceType(attribute->type()));
}
}
