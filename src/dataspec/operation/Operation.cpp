#include "dataspec/operation/Operation.hpp"
#include "core/Validation.hpp"
#include "json/JsonReaders.hpp"
#include "log/TaggedLogger.hpp"

#include <set>

namespace DS {
namespace {

using Json = nlohmann::json;

constexpr char const* kIdField                 = "id";
constexpr char const* kNameField               = "name";
constexpr char const* kDescriptionField        = "description";
constexpr char const* kModeField               = "mode";
constexpr char const* kRepositoryUrlField      = "repository_url";
constexpr char const* kRepositoryNameField     = "repository_name";
constexpr char const* kGitHashField            = "git_hash";
constexpr char const* kWorkspaceOperationField = "workspace_operation";
constexpr char const* kInputsField             = "inputs";
constexpr char const* kOutputsField            = "outputs";

auto rejected(Error error) -> std::unexpected<Error> {
    ds_log("Operation rejected: " + describeError(error), "Operation");
    return std::unexpected(std::move(error));
}

} // namespace

auto Operation::fromJson(nlohmann::json const& json) -> Expected<Operation> {
    if (auto shape = detail::ensure_object(json, "operation"); !shape) {
        return rejected(shape.error());
    }
    static std::set<std::string> const kRequiredFields{kIdField,
                                                       kNameField,
                                                       kDescriptionField,
                                                       kModeField,
                                                       kRepositoryUrlField,
                                                       kRepositoryNameField,
                                                       kGitHashField,
                                                       kWorkspaceOperationField,
                                                       kInputsField,
                                                       kOutputsField};
    if (auto keys = detail::ensure_exact_keys(json, kRequiredFields, "operation"); !keys) {
        return rejected(keys.error());
    }

    Operation operation;

    auto const& rawId = json.at(kIdField);
    auto        id    = rawId.is_string() ? detail::canonicalUuid(rawId.get_ref<std::string const&>()) : std::nullopt;
    if (!id) {
        return rejected(detail::make_error(Error::Code::InvalidValue, kIdField,
                                           detail::echo_value(rawId) + " was not a valid UUID."));
    }
    operation.id_ = std::move(*id);

    struct TextField {
        char const*  key;
        std::string* target;
    };
    for (auto const& field : {TextField{kNameField, &operation.name_},
                              TextField{kDescriptionField, &operation.description_},
                              TextField{kModeField, &operation.mode_},
                              TextField{kRepositoryUrlField, &operation.repositoryUrl_},
                              TextField{kRepositoryNameField, &operation.repositoryName_},
                              TextField{kGitHashField, &operation.gitHash_}}) {
        auto text = detail::read_string(json, field.key);
        if (!text) {
            return rejected(text.error());
        }
        *field.target = std::move(*text);
    }

    auto workspace = detail::parseBooleanLike(json.at(kWorkspaceOperationField));
    if (!workspace) {
        return rejected(detail::make_error(Error::Code::InvalidValue, kWorkspaceOperationField,
                                           detail::echo_value(json.at(kWorkspaceOperationField))
                                               + " cannot be interpreted as a boolean."));
    }
    operation.workspaceOperation_ = *workspace;

    auto inputs = IOCollection::fromJson(json.at(kInputsField), IOKind::Input);
    if (!inputs) {
        return rejected(prefixError(inputs.error(), kInputsField));
    }
    operation.inputs_ = std::move(*inputs);

    auto outputs = IOCollection::fromJson(json.at(kOutputsField), IOKind::Output);
    if (!outputs) {
        return rejected(prefixError(outputs.error(), kOutputsField));
    }
    operation.outputs_ = std::move(*outputs);

    return operation;
}

auto Operation::toJson() const -> nlohmann::json {
    return Json{{kIdField, this->id_},
                {kNameField, this->name_},
                {kDescriptionField, this->description_},
                {kModeField, this->mode_},
                {kRepositoryUrlField, this->repositoryUrl_},
                {kRepositoryNameField, this->repositoryName_},
                {kGitHashField, this->gitHash_},
                {kWorkspaceOperationField, this->workspaceOperation_},
                {kInputsField, this->inputs_.toJson()},
                {kOutputsField, this->outputs_.toJson()}};
}

auto Operation::operator==(Operation const& other) const -> bool {
    return this->name_ == other.name_ && this->description_ == other.description_ && this->inputs_ == other.inputs_
           && this->outputs_ == other.outputs_ && this->repositoryUrl_ == other.repositoryUrl_
           && this->gitHash_ == other.gitHash_ && this->repositoryName_ == other.repositoryName_
           && this->workspaceOperation_ == other.workspaceOperation_;
}

} // namespace DS
