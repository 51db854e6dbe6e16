#include "dataspec/operation/NamedIOEntry.hpp"

#include <doctest/doctest.h>

#include <string>

using namespace DS;
using nlohmann::json;

namespace {

auto entryJson(json required, json spec) -> json {
    return json{{"required", std::move(required)}, {"converter", "api.converters.basic.IntegerConverter"}, {"spec", std::move(spec)}};
}

auto integerSpec() -> json {
    return json{{"attribute_type", "Integer"}};
}

} // namespace

TEST_SUITE("operation.named_io_entry") {
TEST_CASE("exactly three keys are accepted") {
    auto entry = NamedIOEntry::fromJson(entryJson(true, integerSpec()));
    REQUIRE(entry.has_value());
    CHECK(entry->isRequired());
    CHECK(entry->converter() == "api.converters.basic.IntegerConverter");
    CHECK(entry->kind() == IOKind::Input);

    auto extra = entryJson(true, integerSpec());
    extra["description"] = "text";
    auto withExtra = NamedIOEntry::fromJson(extra);
    REQUIRE_FALSE(withExtra.has_value());
    CHECK(withExtra.error().code == Error::Code::MalformedInput);
    CHECK(withExtra.error().message->find("description") != std::string::npos);

    auto missing = entryJson(true, integerSpec());
    missing.erase("converter");
    auto withoutConverter = NamedIOEntry::fromJson(missing);
    REQUIRE_FALSE(withoutConverter.has_value());
    CHECK(withoutConverter.error().message->find("converter") != std::string::npos);

    CHECK(NamedIOEntry::fromJson(json::array()).error().code == Error::Code::MalformedInput);
}

TEST_CASE("required accepts the usual boolean spellings") {
    for (auto const& raw : {json(true), json(1), json("1"), json("true"), json("True")}) {
        auto entry = NamedIOEntry::fromJson(entryJson(raw, integerSpec()));
        REQUIRE(entry.has_value());
        CHECK(entry->isRequired());
    }
    for (auto const& raw : {json(false), json(0), json("0"), json("false")}) {
        auto entry = NamedIOEntry::fromJson(entryJson(raw, integerSpec()));
        REQUIRE(entry.has_value());
        CHECK_FALSE(entry->isRequired());
    }
    CHECK(NamedIOEntry::fromJson(entryJson("maybe", integerSpec())).error().code == Error::Code::InvalidValue);
}

TEST_CASE("spec failures are prefixed") {
    auto entry = NamedIOEntry::fromJson(entryJson(true, json{{"attribute_type", "BoundedInteger"}, {"min", 0}}));
    REQUIRE_FALSE(entry.has_value());
    CHECK(entry.error().code == Error::Code::MissingParameter);
    CHECK(entry.error().message->starts_with("spec: "));
}

TEST_CASE("checkValue applies the required flag to nulls") {
    auto required = NamedIOEntry::fromJson(entryJson(true, integerSpec()));
    auto optional = NamedIOEntry::fromJson(entryJson(false, integerSpec()));
    REQUIRE(required.has_value());
    REQUIRE(optional.has_value());

    CHECK(required->checkValue(nullptr).error().code == Error::Code::NullValue);
    CHECK(optional->checkValue(nullptr).has_value());

    auto value = required->checkValue(7);
    REQUIRE(value.has_value());
    CHECK(value->asInteger() == 7);
    CHECK(required->checkValue("seven").error().code == Error::Code::InvalidValue);
}

TEST_CASE("checkValue ignores the default and keeps the parameters") {
    auto entry = NamedIOEntry::fromJson(
            entryJson(false, json{{"attribute_type", "BoundedInteger"}, {"min", 0}, {"max", 10}, {"default", 5}}));
    REQUIRE(entry.has_value());
    CHECK(entry->checkValue(10).has_value());
    CHECK(entry->checkValue(11).error().code == Error::Code::InvalidValue);
}

TEST_CASE("checkValue can tolerate decorated candidates") {
    auto entry = NamedIOEntry::fromJson(entryJson(true, json{{"attribute_type", "ObservationSet"}}));
    REQUIRE(entry.has_value());

    json candidate{{"elements", json::array({json{{"id", "s1"}, {"attributes", json::object()}, {"color", "#fff"}}})}};
    auto strict = entry->checkValue(candidate);
    REQUIRE_FALSE(strict.has_value());
    CHECK(strict.error().code == Error::Code::MalformedInput);

    auto lenient = entry->checkValue(candidate, true);
    REQUIRE(lenient.has_value());
    CHECK(lenient->elementSet()->contains("s1"));
}

TEST_CASE("resource helpers") {
    auto owned = NamedIOEntry::fromJson(
            entryJson(true, json{{"attribute_type", "DataResource"}, {"many", false}, {"resource_type", "MTX"}}));
    auto bundled = NamedIOEntry::fromJson(
            entryJson(true, json{{"attribute_type", "OperationDataResource"}, {"many", false}, {"resource_type", "MTX"}}));
    auto plain = NamedIOEntry::fromJson(entryJson(true, integerSpec()));
    REQUIRE(owned.has_value());
    REQUIRE(bundled.has_value());
    REQUIRE(plain.has_value());

    CHECK(owned->isDataResource());
    CHECK(owned->isUserDataResource());
    CHECK(bundled->isDataResource());
    CHECK_FALSE(bundled->isUserDataResource());
    CHECK_FALSE(plain->isDataResource());
}

TEST_CASE("serialization and equality") {
    json raw   = entryJson(true, json{{"attribute_type", "PositiveInteger"}, {"default", 3}});
    auto entry = NamedIOEntry::fromJson(raw);
    REQUIRE(entry.has_value());
    CHECK(entry->toJson() == raw);

    auto again = NamedIOEntry::fromJson(entry->toJson());
    REQUIRE(again.has_value());
    CHECK(*entry == *again);

    auto relaxed = NamedIOEntry::fromJson(entryJson(false, json{{"attribute_type", "PositiveInteger"}, {"default", 3}}));
    REQUIRE(relaxed.has_value());
    CHECK_FALSE(*entry == *relaxed);
}
}
