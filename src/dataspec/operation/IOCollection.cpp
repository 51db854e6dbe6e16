#include "dataspec/operation/IOCollection.hpp"
#include "json/JsonReaders.hpp"

#include <string>

namespace DS {

auto IOCollection::fromJson(nlohmann::json const& json, IOKind kind) -> Expected<IOCollection> {
    if (!json.is_object()) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput,
                                                  "The " + std::string(ioKindName(kind))
                                                      + "s of an operation must be given as an object."));
    }

    IOCollection collection{kind};
    for (auto it = json.begin(); it != json.end(); ++it) {
        auto entry = NamedIOEntry::fromJson(it.value(), kind);
        if (!entry) {
            return std::unexpected(prefixError(entry.error(), it.key()));
        }
        collection.entries_.emplace(it.key(), std::move(*entry));
    }
    return collection;
}

auto IOCollection::keys() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(this->entries_.size());
    for (auto const& [name, entry] : this->entries_) {
        names.push_back(name);
    }
    return names;
}

auto IOCollection::find(std::string_view name) const -> NamedIOEntry const* {
    auto it = this->entries_.find(name);
    return it == this->entries_.end() ? nullptr : &it->second;
}

auto IOCollection::toJson() const -> nlohmann::json {
    auto json = nlohmann::json::object();
    for (auto const& [name, entry] : this->entries_) {
        json[name] = entry.toJson();
    }
    return json;
}

} // namespace DS
