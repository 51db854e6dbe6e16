#include "dataspec/attribute/AttributeFactory.hpp"

#include <doctest/doctest.h>

#include <cstdint>

using namespace DS;
using nlohmann::json;

namespace {

auto build(std::string const& type, json value, json extra = json::object(), BuildOptions options = {}) {
    json raw   = extra;
    raw["attribute_type"] = type;
    raw["value"]          = std::move(value);
    return constructAttribute(raw, options);
}

} // namespace

TEST_SUITE("attribute.numeric") {
TEST_CASE("Integer accepts whole numbers only") {
    auto ok = build("Integer", 5);
    REQUIRE(ok.has_value());
    CHECK(ok->asInteger() == 5);
    CHECK(ok->type() == AttributeType::Integer);

    CHECK(build("Integer", -12)->asInteger() == -12);

    auto fromFloat = build("Integer", 3.0);
    REQUIRE_FALSE(fromFloat.has_value());
    CHECK(fromFloat.error().code == Error::Code::InvalidValue);

    CHECK(build("Integer", "5").error().code == Error::Code::InvalidValue);
    CHECK(build("Integer", true).error().code == Error::Code::InvalidValue);
}

TEST_CASE("PositiveInteger and NonnegativeInteger") {
    CHECK(build("PositiveInteger", 1).has_value());
    CHECK(build("PositiveInteger", 0).error().code == Error::Code::InvalidValue);
    CHECK(build("PositiveInteger", -3).error().code == Error::Code::InvalidValue);

    CHECK(build("NonNegativeInteger", 0)->asInteger() == 0);
    CHECK(build("NonNegativeInteger", -1).error().code == Error::Code::InvalidValue);
}

TEST_CASE("BoundedInteger accepts every value inside the bounds") {
    json const bounds{{"min", -2}, {"max", 4}};
    for (std::int64_t v = -2; v <= 4; ++v) {
        auto attribute = build("BoundedInteger", v, bounds);
        REQUIRE(attribute.has_value());
        CHECK(attribute->asInteger() == v);
    }
    for (std::int64_t v : {-100, -3, 5, 1000}) {
        auto attribute = build("BoundedInteger", v, bounds);
        REQUIRE_FALSE(attribute.has_value());
        CHECK(attribute.error().code == Error::Code::InvalidValue);
    }
}

TEST_CASE("BoundedInteger parameter checks") {
    CHECK(build("BoundedInteger", 1, json{{"min", 0}}).error().code == Error::Code::MissingParameter);
    CHECK(build("BoundedInteger", 1, json{{"max", 3}}).error().code == Error::Code::MissingParameter);
    CHECK(build("BoundedInteger", 1, json{{"min", 0.5}, {"max", 3}}).error().code == Error::Code::InvalidParameter);
    CHECK(build("BoundedInteger", 1, json{{"min", "0"}, {"max", 3}}).error().code == Error::Code::InvalidParameter);
    CHECK(build("BoundedInteger", 1, json{{"min", 5}, {"max", 3}}).error().code == Error::Code::InvalidParameter);
}

TEST_CASE("parameters are checked before a null value") {
    auto attribute = build("BoundedInteger", nullptr, json{{"min", 0.5}, {"max", 3}}, BuildOptions::Nullable());
    REQUIRE_FALSE(attribute.has_value());
    CHECK(attribute.error().code == Error::Code::InvalidParameter);
}

TEST_CASE("Float accepts integers, floats and infinity markers") {
    auto fromInt = build("Float", 2);
    REQUIRE(fromInt.has_value());
    CHECK(fromInt->asFloat()->value == doctest::Approx(2.0));

    auto positive = build("Float", "++inf++");
    REQUIRE(positive.has_value());
    CHECK(positive->asFloat()->kind == FloatValue::Kind::PositiveInfinity);
    CHECK(positive->valueToJson() == json("++inf++"));

    auto negative = build("Float", "--inf--");
    REQUIRE(negative.has_value());
    CHECK(negative->asFloat()->kind == FloatValue::Kind::NegativeInfinity);

    CHECK(build("Float", "inf").error().code == Error::Code::InvalidValue);
    CHECK(build("Float", json::array()).error().code == Error::Code::InvalidValue);
}

TEST_CASE("PositiveFloat and NonnegativeFloat") {
    CHECK(build("PositiveFloat", 0.1).has_value());
    CHECK(build("PositiveFloat", "++inf++").has_value());
    CHECK(build("PositiveFloat", 0.0).error().code == Error::Code::InvalidValue);
    CHECK(build("PositiveFloat", "--inf--").error().code == Error::Code::InvalidValue);

    CHECK(build("NonNegativeFloat", 0.0).has_value());
    CHECK(build("NonNegativeFloat", -0.5).error().code == Error::Code::InvalidValue);
    CHECK(build("NonNegativeFloat", "--inf--").error().code == Error::Code::InvalidValue);
}

TEST_CASE("BoundedFloat") {
    json const bounds{{"min", 0}, {"max", 1.0}};
    CHECK(build("BoundedFloat", 0.05, bounds).has_value());
    CHECK(build("BoundedFloat", 1, bounds).has_value());
    CHECK(build("BoundedFloat", 1.01, bounds).error().code == Error::Code::InvalidValue);
    CHECK(build("BoundedFloat", "++inf++", bounds).error().code == Error::Code::InvalidValue);

    auto attribute = build("BoundedFloat", 0.5, bounds);
    REQUIRE(attribute.has_value());
    CHECK(attribute->toJson() == json{{"attribute_type", "BoundedFloat"}, {"value", 0.5}, {"min", 0}, {"max", 1.0}});
}
}
