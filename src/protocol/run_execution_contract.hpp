#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace agentrun::protocol {

enum class RunStatus {
    Completed,
    Failed,
    TimedOut
};

// The immutable outcome of one run.
struct RunResult {
    std::string run_id;
    std::string conversation_id;
    RunStatus status = RunStatus::Failed;
    std::string answer;                  // ordered concatenation of TextDeltas
    std::vector<ToolCall> tool_calls;    // in start order, any lifecycle state
    std::vector<Event> events;           // decoded events in arrival order
    Conversation transcript;             // input messages + streamed messages
    std::optional<core::errors::AgentError> error;
    std::optional<std::string> last_phase;
    std::size_t dropped_frames = 0;
    std::uint32_t connection_attempts = 0;
    std::int64_t started_at_unix_ms = 0;
    std::int64_t ended_at_unix_ms = 0;

    // Filled in by the session controller after persistence; not part of
    // the persisted result itself.
    std::optional<std::filesystem::path> artifact_dir;
    std::optional<core::errors::AgentError> persistence_error;
};

inline std::string to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Completed:
            return "completed";
        case RunStatus::Failed:
            return "failed";
        case RunStatus::TimedOut:
            return "timed_out";
        default:
            return "unknown";
    }
}

}  // namespace agentrun::protocol
