#pragma once

#include <filesystem>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/run_execution_contract.hpp"
#include "protocol/run_log.hpp"

namespace agentrun::session {

inline constexpr const char* kEventLogFile = "events.jsonl";
inline constexpr const char* kResultFile = "result.json";

// Writes one run's artifact pair under <artifact_root>/<run_id>/. Both files
// are staged in a hidden sibling directory and published with one rename, so
// a reader sees either the complete pair or nothing, and an existing
// artifact is never overwritten.
class ArtifactWriter {
public:
    explicit ArtifactWriter(std::filesystem::path artifact_root);

    core::errors::Result<std::filesystem::path> persist(
        const protocol::RunLog& log, const protocol::RunResult& result) const;

    core::errors::Result<std::filesystem::path> run_dir(
        const std::string& run_id) const;

private:
    std::filesystem::path artifact_root_;
    policy::PolicyGuard guard_;
};

core::errors::Result<protocol::RunLog> load_run_log(
    const std::filesystem::path& run_dir);

core::errors::Result<protocol::RunResult> load_result(
    const std::filesystem::path& run_dir);

}  // namespace agentrun::session
