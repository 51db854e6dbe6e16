#pragma once
#include "dataspec/attribute/Attribute.hpp"
#include "dataspec/core/Error.hpp"
#include "dataspec/operation/InputOutputSpec.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace DS {

enum class IOKind {
    Input,
    Output
};

[[nodiscard]] auto ioKindName(IOKind kind) -> std::string_view;

/**
 * One named parameter of an operation: {"required": <bool-like>, "converter": <string>, "spec": SpecJSON}.
 * Exactly these three keys are accepted.
 */
class NamedIOEntry {
public:
    [[nodiscard]] static auto fromJson(nlohmann::json const& json, IOKind kind = IOKind::Input) -> Expected<NamedIOEntry>;

    [[nodiscard]] auto kind() const -> IOKind { return this->kind_; }
    [[nodiscard]] auto isRequired() const -> bool { return this->required_; }
    [[nodiscard]] auto converter() const -> std::string const& { return this->converter_; }
    [[nodiscard]] auto spec() const -> InputOutputSpec const& { return this->spec_; }

    /**
     * Validates a submitted value against spec(). Null is accepted only for
     * optional entries. With `ignoreExtraKeys`, unknown keys inside the
     * candidate (display hints and the like) are dropped instead of rejected.
     */
    [[nodiscard]] auto checkValue(nlohmann::json const& candidate, bool ignoreExtraKeys = false) const -> Expected<Attribute>;

    [[nodiscard]] auto isDataResource() const -> bool { return isResourceType(this->spec_.type()); }
    [[nodiscard]] auto isUserDataResource() const -> bool { return isUserResourceType(this->spec_.type()); }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    auto operator==(NamedIOEntry const& other) const -> bool {
        return this->spec_ == other.spec_ && this->converter_ == other.converter_ && this->required_ == other.required_;
    }

private:
    NamedIOEntry(IOKind kind, bool required, std::string converter, InputOutputSpec spec)
        : kind_(kind), required_(required), converter_(std::move(converter)), spec_(std::move(spec)) {}

    IOKind          kind_;
    bool            required_;
    std::string     converter_;
    InputOutputSpec spec_;
};

} // namespace DS
