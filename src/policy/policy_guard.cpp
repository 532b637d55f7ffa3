#include "policy/policy_guard.hpp"

#include <cctype>
#include <system_error>
#include <utility>

namespace agentrun::policy {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::ToolChoice;
using protocol::ToolChoiceMode;

PolicyGuard::PolicyGuard(ToolNamePolicy name_policy)
    : name_policy_(std::move(name_policy)) {}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

bool PolicyGuard::is_valid_tool_name(const std::string& name) const {
    if (name.empty() || name.size() > name_policy_.max_name_length) {
        return false;
    }
    for (const char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) == 0 && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_root(
    const std::filesystem::path& root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::exists(root, ec) || ec) {
        return AgentError{ErrorCategory::Persistence,
                          "Artifact root does not exist: " + root.string(),
                          "invalid_artifact_root"};
    }
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return AgentError{ErrorCategory::Persistence,
                          "Artifact root is not a directory: " + root.string(),
                          "invalid_artifact_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to resolve artifact root: " + root.string(),
                          "invalid_artifact_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to resolve target path: " + target_path.string(),
                          "invalid_path"};
    }

    if (canonical_candidate == canonical_root ||
        !is_within_root(canonical_root, canonical_candidate)) {
        return AgentError{ErrorCategory::Persistence,
                          "Path escapes artifact root: " +
                              canonical_candidate.string(),
                          "path_outside_root"};
    }

    return canonical_candidate;
}

core::errors::Result<ToolChoice> PolicyGuard::validate_tool_choice(
    const ToolChoice& choice) const {
    if (choice.mode == ToolChoiceMode::None && !choice.allowed.empty()) {
        return AgentError{ErrorCategory::Input,
                          "Tool choice 'none' cannot list allowed tools.",
                          "conflicting_tool_choice",
                          "Drop the allowed tools or use mode 'auto'."};
    }
    for (const auto& name : choice.allowed) {
        if (!is_valid_tool_name(name)) {
            return AgentError{ErrorCategory::Input,
                              "Invalid tool name: '" + name + "'",
                              "invalid_tool_name",
                              "Tool names use letters, digits, '_', '-' or '.'."};
        }
    }
    return choice;
}

bool PolicyGuard::is_tool_permitted(const std::optional<ToolChoice>& choice,
                                    const std::string& tool_name) {
    if (!choice.has_value()) {
        return true;
    }
    if (choice->mode == ToolChoiceMode::None) {
        return false;
    }
    return choice->allowed.empty() ||
           choice->allowed.find(tool_name) != choice->allowed.end();
}

}  // namespace agentrun::policy
