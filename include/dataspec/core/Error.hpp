#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace DS {

struct Error {
    enum class Code {
        NullValue = 0,
        InvalidValue,
        MissingValue,
        MissingParameter,
        InvalidParameter,
        UnknownType,
        UnknownExtraParameter,
        MalformedInput,
        Conflict,
        InvalidResourceType,
        TypeMismatch,
        NotSupported
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::NullValue:
        return "null_value";
    case Error::Code::InvalidValue:
        return "invalid_value";
    case Error::Code::MissingValue:
        return "missing_value";
    case Error::Code::MissingParameter:
        return "missing_parameter";
    case Error::Code::InvalidParameter:
        return "invalid_parameter";
    case Error::Code::UnknownType:
        return "unknown_type";
    case Error::Code::UnknownExtraParameter:
        return "unknown_extra_parameter";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::Conflict:
        return "conflict";
    case Error::Code::InvalidResourceType:
        return "invalid_resource_type";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    case Error::Code::NotSupported:
        return "not_supported";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

// Nested validation reports which outer key produced the failure; the code is kept.
[[nodiscard]] inline auto prefixError(Error error, std::string_view key) -> Error {
    std::string message;
    message.reserve(key.size() + 2 + (error.message ? error.message->size() : 0));
    message.append(key);
    if (error.message && !error.message->empty()) {
        message.append(": ");
        message.append(*error.message);
    }
    error.message = std::move(message);
    return error;
}

} // namespace DS
