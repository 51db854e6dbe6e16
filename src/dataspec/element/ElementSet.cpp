#include "dataspec/element/ElementSet.hpp"
#include "core/Validation.hpp"
#include "json/JsonReaders.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>

namespace DS {
namespace {

using Json = nlohmann::json;

constexpr char const* kMultipleKey = "multiple";
constexpr char const* kElementsKey = "elements";

[[nodiscard]] auto setTypeName(ElementKind kind) -> std::string {
    return std::string(elementKindName(kind)) + "Set";
}

} // namespace

auto ElementSet::fromJson(nlohmann::json const& json, ElementKind kind, BuildOptions const& options)
    -> Expected<ElementSet> {
    if (!json.is_object()) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput,
                                                  "The constructor for an " + setTypeName(kind)
                                                      + " expects an object."));
    }

    Json remaining = json;
    bool singleton = false;
    if (auto multiple = detail::take_key(remaining, kMultipleKey)) {
        auto flag = detail::parseBooleanLike(*multiple);
        if (!flag) {
            return std::unexpected(detail::make_error(Error::Code::MalformedInput, kMultipleKey,
                                                      "must be a boolean, got " + detail::echo_value(*multiple)));
        }
        singleton = !*flag;
    }

    auto elements = detail::take_key(remaining, kElementsKey);
    if (!elements) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput,
                                                  "An " + setTypeName(kind) + " requires an \"elements\" key."));
    }
    if (!elements->is_array()) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput,
                                                  "Within an " + setTypeName(kind)
                                                      + ", the nested \"elements\" key should address a list."));
    }
    if (!remaining.empty() && !options.ignoreExtraKeys) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput,
                                                  "Received extra key(s): "
                                                      + detail::join_keys(detail::object_keys(remaining))));
    }

    ElementSet set{kind, singleton};
    for (std::size_t i = 0; i < elements->size(); ++i) {
        auto const key     = std::string(kElementsKey) + "[" + std::to_string(i) + "]";
        auto       element = Element::fromJson((*elements)[i], kind, options);
        if (!element) {
            return std::unexpected(prefixError(element.error(), key));
        }
        if (auto added = set.add(std::move(*element)); !added) {
            return std::unexpected(prefixError(added.error(), key));
        }
    }
    return set;
}

auto ElementSet::create(ElementKind kind, std::vector<Element> elements, bool singleton) -> Expected<ElementSet> {
    ElementSet set{kind, singleton};
    for (auto& element : elements) {
        if (auto added = set.add(std::move(element)); !added) {
            return std::unexpected(added.error());
        }
    }
    return set;
}

auto ElementSet::contains(std::string_view id) const -> bool {
    return this->index_.contains(std::string(id));
}

auto ElementSet::find(std::string_view id) const -> Element const* {
    auto it = this->index_.find(std::string(id));
    if (it == this->index_.end()) {
        return nullptr;
    }
    return &this->elements_[it->second];
}

auto ElementSet::add(Element element) -> Expected<void> {
    if (element.kind() != this->kind_) {
        return std::unexpected(detail::make_error(Error::Code::TypeMismatch,
                                                  "Cannot add a " + std::string(elementKindName(element.kind()))
                                                      + " to an " + setTypeName(this->kind_) + "."));
    }
    if (this->singleton_ && !this->elements_.empty()) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput,
                                                  "The " + setTypeName(this->kind_)
                                                      + " was declared with multiple=false and already holds an element."));
    }
    if (this->index_.contains(element.id())) {
        return std::unexpected(detail::make_error(Error::Code::MalformedInput,
                                                  "Tried to add a duplicate entry (" + element.id() + ") to an "
                                                      + setTypeName(this->kind_) + "."));
    }
    this->index_.emplace(element.id(), this->elements_.size());
    this->elements_.push_back(std::move(element));
    return {};
}

auto ElementSet::sameKindAs(ElementSet const& other, std::string_view operation) const -> Expected<void> {
    if (this->kind_ != other.kind_) {
        return std::unexpected(detail::make_error(Error::Code::TypeMismatch,
                                                  "Cannot compute the " + std::string(operation) + " of an "
                                                      + setTypeName(this->kind_) + " and a "
                                                      + setTypeName(other.kind_) + "."));
    }
    return {};
}

auto ElementSet::merged(Element const& left, Element const& right) const -> Expected<Element> {
    Element::AttributeMap attributes = left.attributes();
    for (auto const& [name, attribute] : right.attributes()) {
        auto existing = attributes.find(name);
        if (existing == attributes.end()) {
            attributes.emplace(name, attribute);
            continue;
        }
        if (!(existing->second == attribute)) {
            auto message = "When performing an intersection of two sets, encountered a conflict in the attributes for "
                           + left.id() + ". The attribute \"" + name + "\" has differing values of "
                           + existing->second.valueToJson().dump() + " and " + attribute.valueToJson().dump();
            ds_log(message, "ElementSet");
            return std::unexpected(detail::make_error(Error::Code::Conflict, message));
        }
    }
    return Element{left.kind(), left.id(), std::move(attributes),
                   left.permitNullAttributes_ || right.permitNullAttributes_};
}

auto ElementSet::intersect(ElementSet const& other) const -> Expected<std::vector<Element>> {
    if (auto kinds = this->sameKindAs(other, "intersection"); !kinds) {
        return std::unexpected(kinds.error());
    }
    std::vector<Element> result;
    for (auto const& element : this->elements_) {
        auto const* peer = other.find(element.id());
        if (peer == nullptr) {
            continue;
        }
        auto combined = this->merged(element, *peer);
        if (!combined) {
            return std::unexpected(combined.error());
        }
        result.push_back(std::move(*combined));
    }
    return result;
}

auto ElementSet::unite(ElementSet const& other) const -> Expected<std::vector<Element>> {
    if (auto kinds = this->sameKindAs(other, "union"); !kinds) {
        return std::unexpected(kinds.error());
    }
    std::vector<Element> result;
    result.reserve(this->elements_.size() + other.elements_.size());
    for (auto const& element : this->elements_) {
        auto const* peer = other.find(element.id());
        if (peer == nullptr) {
            result.push_back(element);
            continue;
        }
        auto combined = this->merged(element, *peer);
        if (!combined) {
            return std::unexpected(combined.error());
        }
        result.push_back(std::move(*combined));
    }
    for (auto const& element : other.elements_) {
        if (!this->contains(element.id())) {
            result.push_back(element);
        }
    }
    return result;
}

auto ElementSet::difference(ElementSet const& other, DifferenceOptions const& options) const
    -> Expected<std::vector<Element>> {
    if (auto kinds = this->sameKindAs(other, "difference"); !kinds) {
        return std::unexpected(kinds.error());
    }
    std::vector<Element> result;
    for (auto const& element : this->elements_) {
        auto const* peer = other.find(element.id());
        if (peer == nullptr || (options.compareAttributes && !element.sameAttributes(*peer))) {
            result.push_back(element);
        }
    }
    return result;
}

auto ElementSet::collect(Expected<std::vector<Element>> elements) const -> Expected<ElementSet> {
    if (!elements) {
        return std::unexpected(elements.error());
    }
    return create(this->kind_, std::move(*elements));
}

auto ElementSet::setIntersection(ElementSet const& other) const -> Expected<ElementSet> {
    return this->collect(this->intersect(other));
}

auto ElementSet::setUnion(ElementSet const& other) const -> Expected<ElementSet> {
    return this->collect(this->unite(other));
}

auto ElementSet::setDifference(ElementSet const& other) const -> Expected<ElementSet> {
    return this->collect(this->difference(other));
}

auto ElementSet::isSubsetOf(ElementSet const& other) const -> bool {
    if (this->kind_ != other.kind_) {
        return false;
    }
    return std::ranges::all_of(this->elements_, [&other](Element const& element) {
        return other.contains(element.id());
    });
}

auto ElementSet::isProperSubsetOf(ElementSet const& other) const -> bool {
    return this->size() < other.size() && this->isSubsetOf(other);
}

auto ElementSet::isProperSupersetOf(ElementSet const& other) const -> bool {
    return other.isProperSubsetOf(*this);
}

auto ElementSet::toJson() const -> nlohmann::json {
    Json elements = Json::array();
    for (auto const& element : this->elements_) {
        elements.push_back(element.toJson());
    }
    return Json{{kMultipleKey, !this->singleton_}, {kElementsKey, std::move(elements)}};
}

auto ElementSet::hash() const -> std::size_t {
    std::vector<std::string_view> ids;
    ids.reserve(this->elements_.size());
    for (auto const& element : this->elements_) {
        ids.push_back(element.id());
    }
    std::ranges::sort(ids);

    std::size_t seed = std::hash<bool>{}(this->singleton_) ^ (static_cast<std::size_t>(this->kind_) << 1);
    for (auto id : ids) {
        seed ^= std::hash<std::string_view>{}(id) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

auto ElementSet::operator==(ElementSet const& other) const -> bool {
    return this->kind_ == other.kind_ && this->singleton_ == other.singleton_ && this->size() == other.size()
           && this->isSubsetOf(other);
}

} // namespace DS
