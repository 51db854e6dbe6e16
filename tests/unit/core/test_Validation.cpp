#include "core/Validation.hpp"

#include <doctest/doctest.h>

using namespace DS;
using namespace DS::detail;

TEST_SUITE("core.validation") {
TEST_CASE("identifiers are trimmed and spaces become underscores") {
    auto name = normalizeIdentifier("  sample one ");
    REQUIRE(name.has_value());
    CHECK(*name == "sample_one");

    CHECK(normalizeIdentifier("A.b-c_1").value() == "A.b-c_1");
}

TEST_CASE("identifiers must start with a letter") {
    auto digit = normalizeIdentifier("1abc");
    REQUIRE_FALSE(digit.has_value());
    CHECK(digit.error().code == Error::Code::InvalidValue);

    CHECK_FALSE(normalizeIdentifier("").has_value());
    CHECK_FALSE(normalizeIdentifier("ab?c").has_value());
    CHECK_FALSE(isIdentifier("_leading"));
    CHECK(isIdentifier("x"));
}

TEST_CASE("uuid forms are canonicalized") {
    auto const expected = std::string{"a1b2c3d4-e5f6-4711-8899-aabbccddeeff"};
    CHECK(canonicalUuid("A1B2C3D4-E5F6-4711-8899-AABBCCDDEEFF") == expected);
    CHECK(canonicalUuid("a1b2c3d4e5f647118899aabbccddeeff") == expected);
    CHECK(canonicalUuid("{a1b2c3d4-e5f6-4711-8899-aabbccddeeff}") == expected);
    CHECK(canonicalUuid("urn:uuid:a1b2c3d4-e5f6-4711-8899-aabbccddeeff") == expected);

    CHECK_FALSE(canonicalUuid("abc").has_value());
    CHECK_FALSE(canonicalUuid("a1b2c3d4-e5f6-4711-8899-aabbccddeefg").has_value());
    CHECK_FALSE(canonicalUuid("a1b2c3d4e-5f6-4711-8899-aabbccddeeff").has_value());
}

TEST_CASE("boolean-like values") {
    using nlohmann::json;
    CHECK(parseBooleanLike(json(true)) == true);
    CHECK(parseBooleanLike(json(0)) == false);
    CHECK(parseBooleanLike(json(1)) == true);
    CHECK(parseBooleanLike(json("True")) == true);
    CHECK(parseBooleanLike(json("FALSE")) == false);

    CHECK_FALSE(parseBooleanLike(json(2)).has_value());
    CHECK_FALSE(parseBooleanLike(json(-1)).has_value());
    CHECK_FALSE(parseBooleanLike(json("yes")).has_value());
    CHECK_FALSE(parseBooleanLike(json(1.0)).has_value());
    CHECK_FALSE(parseBooleanLike(json(nullptr)).has_value());
}
}
