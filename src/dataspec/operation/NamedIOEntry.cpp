#include "dataspec/operation/NamedIOEntry.hpp"
#include "dataspec/attribute/AttributeFactory.hpp"
#include "core/Validation.hpp"
#include "json/JsonReaders.hpp"

#include <optional>
#include <set>
#include <string>

namespace DS {
namespace {

using Json = nlohmann::json;

constexpr char const* kRequiredKey  = "required";
constexpr char const* kConverterKey = "converter";
constexpr char const* kSpecKey      = "spec";

// Boolean forms plus the digit strings "0" and "1".
[[nodiscard]] auto readRequired(Json const& raw) -> std::optional<bool> {
    if (raw.is_string()) {
        auto const& text = raw.get_ref<std::string const&>();
        if (text == "0")
            return false;
        if (text == "1")
            return true;
    }
    return detail::parseBooleanLike(raw);
}

} // namespace

auto ioKindName(IOKind kind) -> std::string_view {
    return kind == IOKind::Input ? "input" : "output";
}

auto NamedIOEntry::fromJson(nlohmann::json const& json, IOKind kind) -> Expected<NamedIOEntry> {
    if (!json.is_object()) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput,
                                                  "The constructor for an " + std::string(ioKindName(kind))
                                                      + " expects an object."));
    }
    static std::set<std::string> const kRequiredKeys{kRequiredKey, kConverterKey, kSpecKey};
    if (auto keys = detail::ensure_exact_keys(json, kRequiredKeys, ioKindName(kind)); !keys) {
        return std::unexpected(keys.error());
    }

    auto required = readRequired(json.at(kRequiredKey));
    if (!required) {
        return std::unexpected(detail::make_error(Error::Code::InvalidValue,
                                                  "The \"required\" key should be specified using standard boolean values."));
    }

    auto const& rawConverter = json.at(kConverterKey);
    auto        converter    = rawConverter.is_string() ? rawConverter.get<std::string>() : rawConverter.dump();

    auto spec = InputOutputSpec::fromJson(json.at(kSpecKey));
    if (!spec) {
        return std::unexpected(prefixError(spec.error(), kSpecKey));
    }
    return NamedIOEntry{kind, *required, std::move(converter), std::move(*spec)};
}

auto NamedIOEntry::checkValue(nlohmann::json const& candidate, bool ignoreExtraKeys) const -> Expected<Attribute> {
    auto attributeJson = this->spec_.toJson();
    attributeJson.erase("default");
    attributeJson["value"] = candidate;
    return constructAttribute(attributeJson, BuildOptions{.allowNull = !this->required_, .ignoreExtraKeys = ignoreExtraKeys});
}

auto NamedIOEntry::toJson() const -> nlohmann::json {
    return Json{{kRequiredKey, this->required_}, {kConverterKey, this->converter_}, {kSpecKey, this->spec_.toJson()}};
}

} // namespace DS
