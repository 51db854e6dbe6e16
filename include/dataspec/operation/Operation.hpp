#pragma once
#include "dataspec/core/Error.hpp"
#include "dataspec/operation/IOCollection.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace DS {

/**
 * The declared contract of one analysis tool.
 *
 * The JSON form has exactly the keys id, name, description, mode,
 * repository_url, repository_name, git_hash, workspace_operation, inputs and
 * outputs. Any difference is a MalformedInput listing the missing and the
 * extra keys together.
 */
class Operation {
public:
    [[nodiscard]] static auto fromJson(nlohmann::json const& json) -> Expected<Operation>;

    // Lower-case hyphenated UUID text.
    [[nodiscard]] auto id() const -> std::string const& { return this->id_; }
    [[nodiscard]] auto name() const -> std::string const& { return this->name_; }
    [[nodiscard]] auto description() const -> std::string const& { return this->description_; }
    [[nodiscard]] auto mode() const -> std::string const& { return this->mode_; }
    [[nodiscard]] auto repositoryUrl() const -> std::string const& { return this->repositoryUrl_; }
    [[nodiscard]] auto repositoryName() const -> std::string const& { return this->repositoryName_; }
    [[nodiscard]] auto gitHash() const -> std::string const& { return this->gitHash_; }
    [[nodiscard]] auto isWorkspaceOperation() const -> bool { return this->workspaceOperation_; }
    [[nodiscard]] auto inputs() const -> IOCollection const& { return this->inputs_; }
    [[nodiscard]] auto outputs() const -> IOCollection const& { return this->outputs_; }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    // The id and the run mode do not take part; two registrations of the same tool compare equal.
    auto operator==(Operation const& other) const -> bool;

private:
    Operation() : inputs_(IOKind::Input), outputs_(IOKind::Output) {}

    std::string  id_;
    std::string  name_;
    std::string  description_;
    std::string  mode_;
    std::string  repositoryUrl_;
    std::string  repositoryName_;
    std::string  gitHash_;
    bool         workspaceOperation_ = false;
    IOCollection inputs_;
    IOCollection outputs_;
};

} // namespace DS
