#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace agentrun::policy {

struct ToolNamePolicy {
    std::size_t max_name_length = 128;
};

class PolicyGuard {
public:
    explicit PolicyGuard(ToolNamePolicy name_policy = {});

    // Resolves `target_path` (relative paths against `root`) and rejects it
    // unless it stays inside `root`.
    core::errors::Result<std::filesystem::path> validate_path_in_root(
        const std::filesystem::path& root,
        const std::filesystem::path& target_path) const;

    core::errors::Result<protocol::ToolChoice> validate_tool_choice(
        const protocol::ToolChoice& choice) const;

    // Without a constraint every tool is permitted.
    static bool is_tool_permitted(const std::optional<protocol::ToolChoice>& choice,
                                  const std::string& tool_name);

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    bool is_valid_tool_name(const std::string& name) const;

    ToolNamePolicy name_policy_;
};

}  // namespace agentrun::policy
