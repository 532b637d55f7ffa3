#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"

namespace agentrun::protocol {

// A frame the decoder rejected and the run kept going without.
struct DroppedFrame {
    std::string raw;
    std::string reason;
};

enum class StreamEndCause {
    Closed,            // connection closed or end marker seen
    DeadlineExceeded   // overall run timeout fired
};

struct StreamEnd {
    StreamEndCause cause = StreamEndCause::Closed;
    std::string detail;
};

using LogBody = std::variant<Event, DroppedFrame, StreamEnd>;

struct LogEntry {
    std::uint64_t seq = 0;
    std::int64_t ts_unix_ms = 0;
    LogBody body;
};

// The raw record of one run: everything the state machine consumed, in
// order. Replaying it reproduces the run's RunResult.
struct RunLog {
    std::string run_id;
    Conversation conversation;
    bool strict = false;
    std::int64_t started_at_unix_ms = 0;
    std::uint32_t connection_attempts = 0;
    std::vector<LogEntry> entries;

    // Set when the run never got a stream: connection retries ran out.
    std::optional<core::errors::AgentError> abandoned;
    std::int64_t abandoned_at_unix_ms = 0;
};

inline std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count());
}

inline std::string to_string(const StreamEndCause cause) {
    return cause == StreamEndCause::DeadlineExceeded ? "deadline_exceeded"
                                                     : "closed";
}

}  // namespace agentrun::protocol
