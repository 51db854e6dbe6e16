#include "dataspec/attribute/Attribute.hpp"
#include "dataspec/attribute/AttributeFactory.hpp"
#include "dataspec/attribute/AttributeList.hpp"
#include "dataspec/element/Element.hpp"
#include "dataspec/element/ElementSet.hpp"
#include "attribute/AttributeBuilders.hpp"
#include "json/JsonReaders.hpp"

#include <string>
#include <type_traits>

namespace DS {
namespace {

using Json = nlohmann::json;

auto floatToJson(FloatValue const& v) -> Json {
    switch (v.kind) {
    case FloatValue::Kind::PositiveInfinity:
        return Json(std::string(kPositiveInfinityMarker));
    case FloatValue::Kind::NegativeInfinity:
        return Json(std::string(kNegativeInfinityMarker));
    case FloatValue::Kind::Finite:
        break;
    }
    return Json(v.value);
}

// Compound payloads compare by what they point at.
template <typename T>
auto samePayload(std::shared_ptr<T const> const& lhs, std::shared_ptr<T const> const& rhs) -> bool {
    if (lhs == rhs)
        return true;
    if (!lhs || !rhs)
        return false;
    return *lhs == *rhs;
}

} // namespace

auto Attribute::fromJson(nlohmann::json const& json, BuildOptions const& options) -> Expected<Attribute> {
    return constructAttribute(json, options);
}

auto Attribute::asInteger() const -> std::optional<std::int64_t> {
    if (auto const* v = std::get_if<std::int64_t>(&this->value_))
        return *v;
    return std::nullopt;
}

auto Attribute::asFloat() const -> std::optional<FloatValue> {
    if (auto const* v = std::get_if<FloatValue>(&this->value_))
        return *v;
    return std::nullopt;
}

auto Attribute::asString() const -> std::optional<std::string_view> {
    if (auto const* v = std::get_if<std::string>(&this->value_))
        return std::string_view{*v};
    return std::nullopt;
}

auto Attribute::asBoolean() const -> std::optional<bool> {
    if (auto const* v = std::get_if<bool>(&this->value_))
        return *v;
    return std::nullopt;
}

auto Attribute::resources() const -> ResourceReference const* {
    return std::get_if<ResourceReference>(&this->value_);
}

auto Attribute::list() const -> AttributeList const* {
    auto const* held = std::get_if<std::shared_ptr<AttributeList const>>(&this->value_);
    return held ? held->get() : nullptr;
}

auto Attribute::element() const -> Element const* {
    auto const* held = std::get_if<std::shared_ptr<Element const>>(&this->value_);
    return held ? held->get() : nullptr;
}

auto Attribute::elementSet() const -> ElementSet const* {
    auto const* held = std::get_if<std::shared_ptr<ElementSet const>>(&this->value_);
    return held ? held->get() : nullptr;
}

auto Attribute::checkResourceTypeKeys(std::set<std::string> const& available) const -> Expected<void> {
    if (!isResourceType(this->type_)) {
        return std::unexpected(detail::make_error(Error::Code::NotSupported,
                                                  std::string(this->typeName())
                                                      + " attributes do not declare resource types."));
    }

    std::vector<std::string> declared = this->parameters_.resourceTypes;
    if (this->parameters_.resourceType) {
        declared.push_back(*this->parameters_.resourceType);
    }

    std::set<std::string> rejected;
    for (auto const& resourceType : declared) {
        if (!available.contains(resourceType)) {
            rejected.insert(resourceType);
        }
    }
    if (!rejected.empty()) {
        return std::unexpected(detail::make_error(Error::Code::InvalidResourceType,
                                                  "The resource type(s) " + detail::join_keys(rejected)
                                                      + " are not valid. Choose from: " + detail::join_keys(available)));
    }
    return {};
}

auto Attribute::valueToJson() const -> nlohmann::json {
    return std::visit(
            [](auto const& held) -> Json {
                using T = std::decay_t<decltype(held)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return Json(nullptr);
                } else if constexpr (std::is_same_v<T, FloatValue>) {
                    return floatToJson(held);
                } else if constexpr (std::is_same_v<T, ResourceReference>) {
                    if (held.submittedAsList) {
                        return Json(held.ids);
                    }
                    return held.ids.empty() ? Json(nullptr) : Json(held.ids.front());
                } else if constexpr (std::is_same_v<T, std::shared_ptr<AttributeList const>>) {
                    Json items = Json::array();
                    if (held) {
                        for (auto const& item : *held) {
                            items.push_back(item.valueToJson());
                        }
                    }
                    return items;
                } else if constexpr (std::is_same_v<T, std::shared_ptr<Element const>>
                                     || std::is_same_v<T, std::shared_ptr<ElementSet const>>) {
                    return held ? held->toJson() : Json(nullptr);
                } else {
                    return Json(held);
                }
            },
            this->value_);
}

auto Attribute::toJson() const -> nlohmann::json {
    Json json;
    json["attribute_type"] = std::string(this->typeName());
    json["value"]          = this->valueToJson();

    auto const& params = this->parameters_;
    if (params.min)
        json["min"] = detail::boundToJson(*params.min);
    if (params.max)
        json["max"] = detail::boundToJson(*params.max);
    if (this->type_ == AttributeType::OptionString)
        json["options"] = params.options;
    if (params.many)
        json["many"] = *params.many;
    if (params.resourceType)
        json["resource_type"] = *params.resourceType;
    if (this->type_ == AttributeType::VariableDataResource)
        json["resource_types"] = params.resourceTypes;
    return json;
}

auto Attribute::operator==(Attribute const& other) const -> bool {
    if (this->type_ != other.type_ || this->parameters_ != other.parameters_)
        return false;
    if (this->value_.index() != other.value_.index())
        return false;
    return std::visit(
            [&other](auto const& held) -> bool {
                using T          = std::decay_t<decltype(held)>;
                auto const& peer = std::get<T>(other.value_);
                if constexpr (std::is_same_v<T, std::shared_ptr<AttributeList const>>
                              || std::is_same_v<T, std::shared_ptr<Element const>>
                              || std::is_same_v<T, std::shared_ptr<ElementSet const>>) {
                    return samePayload(held, peer);
                } else {
                    return held == peer;
                }
            },
            this->value_);
}

} // namespace DS
