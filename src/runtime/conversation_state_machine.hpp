#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/run_log.hpp"
#include "protocol/run_request.hpp"
#include "protocol/tool_contract.hpp"

namespace agentrun::runtime {

enum class MachineState {
    Idle,
    Streaming,
    Completed,
    Failed,
    TimedOut
};

// Everything accumulated during one run; the aggregator's only input
// besides the run log header.
struct ConversationSnapshot {
    MachineState state = MachineState::Idle;
    std::string answer;
    std::vector<protocol::ToolCall> tool_calls;      // in start order
    std::vector<protocol::Event> events;             // accepted, in order
    std::vector<protocol::Message> streamed_messages;
    std::optional<core::errors::AgentError> error;
    std::optional<std::string> last_phase;
    std::size_t dropped_frames = 0;
    std::optional<std::int64_t> terminal_ts_unix_ms;
};

// Idle -> Streaming -> {Completed, Failed, TimedOut}. Once terminal, every
// further input is ignored.
class ConversationStateMachine {
public:
    explicit ConversationStateMachine(protocol::DecodePolicy policy = {});

    // Dispatches one log entry, remembering its timestamp if it ends the run.
    void consume(const protocol::LogEntry& entry);

    void on_event(const protocol::Event& event);
    void on_dropped_frame(const protocol::DroppedFrame& frame);
    void on_stream_end(const protocol::StreamEnd& end);

    MachineState state() const { return snapshot_.state; }
    bool is_terminal() const;
    // True once the first decoded event has arrived.
    bool has_observed_event() const { return !snapshot_.events.empty(); }
    std::size_t open_tool_calls() const;
    const ConversationSnapshot& snapshot() const { return snapshot_; }

private:
    friend struct TransitionVisitor;

    void apply(const protocol::TextDeltaEvent& event);
    void apply(const protocol::ToolCallStartEvent& event);
    void apply(const protocol::ToolCallResultEvent& event);
    void apply(const protocol::StatusEvent& event);
    void apply(const protocol::ErrorEvent& event);
    void apply(const protocol::FinalEvent& event);

    void fail(core::errors::AgentError error);
    void enter_terminal(MachineState next);

    ConversationSnapshot snapshot_;
    std::unordered_map<std::string, std::size_t> tool_index_;
    protocol::DecodePolicy policy_;
    std::int64_t current_ts_unix_ms_ = 0;
};

std::string to_string(MachineState state);

}  // namespace agentrun::runtime
