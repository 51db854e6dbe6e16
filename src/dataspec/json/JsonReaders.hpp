#pragma once

#include "dataspec/core/Error.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace DS::detail {

using Json = nlohmann::json;

inline constexpr std::size_t kMaxEchoedValueLength = 64;

[[nodiscard]] inline auto make_error(Error::Code code, std::string_view message) -> Error {
    return Error{code, std::string(message)};
}

[[nodiscard]] inline auto make_error(Error::Code code,
                                     std::string_view field,
                                     std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    if (!detail.empty()) {
        message.append(": ");
        message.append(detail);
    }
    return Error{code, std::move(message)};
}

// Short rendering of a submitted value for error messages.
[[nodiscard]] inline auto echo_value(Json const& value) -> std::string {
    auto text = value.is_string() ? value.get<std::string>() : value.dump();
    if (text.size() > kMaxEchoedValueLength) {
        text.resize(kMaxEchoedValueLength);
        text.append("...");
    }
    return text;
}

[[nodiscard]] inline auto join_keys(std::set<std::string> const& keys) -> std::string {
    std::string joined;
    for (auto const& key : keys) {
        if (!joined.empty())
            joined.push_back(',');
        joined.append(key);
    }
    return joined;
}

[[nodiscard]] inline auto object_keys(Json const& json) -> std::set<std::string> {
    std::set<std::string> keys;
    for (auto it = json.begin(); it != json.end(); ++it) {
        keys.insert(it.key());
    }
    return keys;
}

[[nodiscard]] inline auto ensure_object(Json const& json, std::string_view context) -> Expected<void> {
    if (!json.is_object()) {
        return std::unexpected(make_error(Error::Code::MalformedInput, context,
                                          "must be a JSON object"));
    }
    return {};
}

[[nodiscard]] inline auto read_string(Json const& json, char const* key) -> Expected<std::string> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_string()) {
            return std::unexpected(make_error(Error::Code::MalformedInput, key, "must be a string"));
        }
        return it->get<std::string>();
    }
    return std::unexpected(make_error(Error::Code::MalformedInput, key, "is required"));
}

// Removes `key` from `object` and hands back its value, if present.
[[nodiscard]] inline auto take_key(Json& object, std::string_view key) -> std::optional<Json> {
    auto it = object.find(std::string(key));
    if (it == object.end()) {
        return std::nullopt;
    }
    Json value = std::move(*it);
    object.erase(it);
    return value;
}

/**
 * Compares the key set of `json` with `required`. Any difference is a single
 * MalformedInput error listing both the missing and the extra keys.
 */
[[nodiscard]] inline auto ensure_exact_keys(Json const& json,
                                            std::set<std::string> const& required,
                                            std::string_view context) -> Expected<void> {
    auto const submitted = object_keys(json);
    std::set<std::string> missing;
    std::set<std::string> extra;
    std::ranges::set_difference(required, submitted, std::inserter(missing, missing.end()));
    std::ranges::set_difference(submitted, required, std::inserter(extra, extra.end()));
    if (missing.empty() && extra.empty()) {
        return {};
    }
    std::string detail{"the set of fields did not match the requirements."};
    if (!missing.empty()) {
        detail.append(" Missing keys: ");
        detail.append(join_keys(missing));
        detail.push_back('.');
    }
    if (!extra.empty()) {
        detail.append(" Extra keys: ");
        detail.append(join_keys(extra));
        detail.push_back('.');
    }
    return std::unexpected(make_error(Error::Code::MalformedInput, context, detail));
}

} // namespace DS::detail
