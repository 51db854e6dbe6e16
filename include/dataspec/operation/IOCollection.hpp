#pragma once
#include "dataspec/core/Error.hpp"
#include "dataspec/operation/NamedIOEntry.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace DS {

// The inputs or the outputs of an operation, keyed by parameter name.
class IOCollection {
public:
    using EntryMap = std::map<std::string, NamedIOEntry, std::less<>>;

    explicit IOCollection(IOKind kind) : kind_(kind) {}

    /**
     * Builds every entry of a {<name>: IOEntryJSON} object. The first failing
     * entry aborts construction; its error is prefixed with the entry name.
     */
    [[nodiscard]] static auto fromJson(nlohmann::json const& json, IOKind kind) -> Expected<IOCollection>;

    [[nodiscard]] auto kind() const -> IOKind { return this->kind_; }
    [[nodiscard]] auto entries() const -> EntryMap const& { return this->entries_; }
    [[nodiscard]] auto keys() const -> std::vector<std::string>;
    [[nodiscard]] auto find(std::string_view name) const -> NamedIOEntry const*;
    [[nodiscard]] auto size() const -> std::size_t { return this->entries_.size(); }
    [[nodiscard]] auto empty() const -> bool { return this->entries_.empty(); }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    auto operator==(IOCollection const& other) const -> bool { return this->entries_ == other.entries_; }

private:
    IOKind   kind_;
    EntryMap entries_;
};

} // namespace DS
