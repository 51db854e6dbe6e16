#include "core/Validation.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>

namespace DS::detail {
namespace {

[[nodiscard]] auto to_lower(std::string_view raw) -> std::string {
    std::string lowered;
    lowered.reserve(raw.size());
    for (unsigned char ch : raw) {
        lowered.push_back(static_cast<char>(std::tolower(ch)));
    }
    return lowered;
}

[[nodiscard]] auto trim(std::string_view raw) -> std::string_view {
    while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.front())) != 0) {
        raw.remove_prefix(1);
    }
    while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back())) != 0) {
        raw.remove_suffix(1);
    }
    return raw;
}

[[nodiscard]] auto is_hex(char ch) -> bool {
    return std::isxdigit(static_cast<unsigned char>(ch)) != 0;
}

} // namespace

auto isIdentifier(std::string_view candidate) -> bool {
    if (candidate.empty() || std::isalpha(static_cast<unsigned char>(candidate.front())) == 0) {
        return false;
    }
    return std::ranges::all_of(candidate, [](char ch) {
        return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '.' || ch == '-' || ch == '_';
    });
}

auto normalizeIdentifier(std::string_view raw) -> Expected<std::string> {
    std::string name{trim(raw)};
    std::ranges::replace(name, ' ', '_');
    if (!isIdentifier(name)) {
        return std::unexpected(Error{Error::Code::InvalidValue,
                                     "The name \"" + std::string(raw)
                                         + "\" did not match the naming requirements. Check that it starts with a"
                                           " letter and only contains letters, numbers, '.', '-' and '_'."});
    }
    return name;
}

auto canonicalUuid(std::string_view text) -> std::optional<std::string> {
    text = trim(text);
    if (text.size() > 9 && to_lower(text.substr(0, 9)) == "urn:uuid:") {
        text.remove_prefix(9);
    }
    if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
        text = text.substr(1, text.size() - 2);
    }

    std::string digits;
    digits.reserve(32);
    if (text.size() == 36) {
        constexpr std::array<std::size_t, 4> kHyphens{8, 13, 18, 23};
        for (std::size_t i = 0; i < text.size(); ++i) {
            bool const hyphenSlot = std::ranges::find(kHyphens, i) != kHyphens.end();
            if (hyphenSlot) {
                if (text[i] != '-')
                    return std::nullopt;
                continue;
            }
            if (!is_hex(text[i]))
                return std::nullopt;
            digits.push_back(text[i]);
        }
    } else if (text.size() == 32) {
        if (!std::ranges::all_of(text, is_hex))
            return std::nullopt;
        digits.assign(text);
    } else {
        return std::nullopt;
    }

    digits = to_lower(digits);
    std::string canonical;
    canonical.reserve(36);
    canonical.append(digits, 0, 8).push_back('-');
    canonical.append(digits, 8, 4).push_back('-');
    canonical.append(digits, 12, 4).push_back('-');
    canonical.append(digits, 16, 4).push_back('-');
    canonical.append(digits, 20, 12);
    return canonical;
}

auto parseBooleanLike(nlohmann::json const& value) -> std::optional<bool> {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        // covers unsigned as well
        if (value.is_number_unsigned()) {
            auto const v = value.get<std::uint64_t>();
            if (v == 0U || v == 1U)
                return v == 1U;
            return std::nullopt;
        }
        auto const v = value.get<std::int64_t>();
        if (v == 0 || v == 1)
            return v == 1;
        return std::nullopt;
    }
    if (value.is_string()) {
        auto const lowered = to_lower(value.get<std::string>());
        if (lowered == "true")
            return true;
        if (lowered == "false")
            return false;
    }
    return std::nullopt;
}

} // namespace DS::detail
