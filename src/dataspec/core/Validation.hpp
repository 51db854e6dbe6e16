#pragma once

#include "dataspec/core/Error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace DS::detail {

inline constexpr std::size_t kMaxStringLength = 100;

/**
 * Trims surrounding whitespace, turns inner spaces into underscores and checks
 * the identifier grammar: a leading letter followed by letters, digits, '.',
 * '-' or '_'. Failures are InvalidValue.
 */
[[nodiscard]] auto normalizeIdentifier(std::string_view raw) -> Expected<std::string>;

[[nodiscard]] auto isIdentifier(std::string_view candidate) -> bool;

/**
 * Parses the textual UUID forms ("xxxxxxxx-xxxx-...", 32 bare hex digits,
 * optionally wrapped in braces or prefixed with "urn:uuid:") and returns the
 * lower-case hyphenated form.
 */
[[nodiscard]] auto canonicalUuid(std::string_view text) -> std::optional<std::string>;

/**
 * The boolean conventions shared by the Boolean attribute, the "many"
 * parameter and flags like "workspace_operation": JSON booleans, the
 * integers 0/1 and the words true/false in any case.
 */
[[nodiscard]] auto parseBooleanLike(nlohmann::json const& value) -> std::optional<bool>;

} // namespace DS::detail
