#include "runtime/conversation_state_machine.hpp"

#include <utility>
#include <variant>
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"

namespace agentrun::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::ContentKind;
using protocol::Message;
using protocol::Role;
using protocol::ToolCall;
using protocol::ToolCallState;

// One overload per Event alternative; std::visit refuses to compile if an
// alternative is left unhandled.
struct TransitionVisitor {
    ConversationStateMachine& machine;

    void operator()(const protocol::TextDeltaEvent& event) const { machine.apply(event); }
    void operator()(const protocol::ToolCallStartEvent& event) const { machine.apply(event); }
    void operator()(const protocol::ToolCallResultEvent& event) const { machine.apply(event); }
    void operator()(const protocol::StatusEvent& event) const { machine.apply(event); }
    void operator()(const protocol::ErrorEvent& event) const { machine.apply(event); }
    void operator()(const protocol::FinalEvent& event) const { machine.apply(event); }
};

namespace {

struct EntryVisitor {
    ConversationStateMachine& machine;

    void operator()(const protocol::Event& event) const { machine.on_event(event); }
    void operator()(const protocol::DroppedFrame& frame) const { machine.on_dropped_frame(frame); }
    void operator()(const protocol::StreamEnd& end) const { machine.on_stream_end(end); }
};

}  // namespace

std::string to_string(const MachineState state) {
    switch (state) {
        case MachineState::Idle:
            return "idle";
        case MachineState::Streaming:
            return "streaming";
        case MachineState::Completed:
            return "completed";
        case MachineState::Failed:
            return "failed";
        case MachineState::TimedOut:
            return "timed_out";
        default:
            return "unknown";
    }
}

ConversationStateMachine::ConversationStateMachine(protocol::DecodePolicy policy)
    : policy_(policy) {}

bool ConversationStateMachine::is_terminal() const {
    return snapshot_.state == MachineState::Completed ||
           snapshot_.state == MachineState::Failed ||
           snapshot_.state == MachineState::TimedOut;
}

std::size_t ConversationStateMachine::open_tool_calls() const {
    std::size_t open = 0;
    for (const auto& call : snapshot_.tool_calls) {
        if (call.state == ToolCallState::Started) {
            ++open;
        }
    }
    return open;
}

void ConversationStateMachine::consume(const protocol::LogEntry& entry) {
    current_ts_unix_ms_ = entry.ts_unix_ms;
    std::visit(EntryVisitor{*this}, entry.body);
}

void ConversationStateMachine::on_event(const protocol::Event& event) {
    if (is_terminal()) {
        AGENTRUN_LOG_DEBUG("StateMachine: ignoring " + protocol::event_tag(event) +
                           " after terminal state");
        return;
    }
    if (snapshot_.state == MachineState::Idle) {
        snapshot_.state = MachineState::Streaming;
        AGENTRUN_LOG_INFO("StateMachine: idle -> streaming");
    }
    snapshot_.events.push_back(event);
    std::visit(TransitionVisitor{*this}, event);
}

void ConversationStateMachine::on_dropped_frame(const protocol::DroppedFrame& frame) {
    if (is_terminal()) {
        return;
    }
    ++snapshot_.dropped_frames;
    if (policy_.strict) {
        fail(AgentError{ErrorCategory::Decode,
                        "Malformed frame in strict mode: " + protocol::to_valid_utf8(frame.reason),
                        "malformed_frame", protocol::to_valid_utf8(frame.raw)});
        return;
    }
    AGENTRUN_LOG_WARN("StateMachine: dropped malformed frame (" + frame.reason + ")");
}

void ConversationStateMachine::on_stream_end(const protocol::StreamEnd& end) {
    if (is_terminal()) {
        return;
    }
    if (end.cause == protocol::StreamEndCause::DeadlineExceeded) {
        snapshot_.error = AgentError{ErrorCategory::Timeout,
                                     "Run deadline exceeded before a terminal event.",
                                     "deadline_exceeded", end.detail};
        enter_terminal(MachineState::TimedOut);
        return;
    }
    std::string message = "Stream closed without a final or error event.";
    if (!end.detail.empty()) {
        message += " " + end.detail;
    }
    fail(AgentError{ErrorCategory::UnexpectedEndOfStream, message,
                    "unexpected_end_of_stream"});
}

void ConversationStateMachine::apply(const protocol::TextDeltaEvent& event) {
    snapshot_.answer += event.text;

    auto& messages = snapshot_.streamed_messages;
    if (!messages.empty() && messages.back().role == Role::Agent &&
        !messages.back().parts.empty() &&
        messages.back().parts.back().kind == ContentKind::Text) {
        messages.back().parts.back().text += event.text;
        return;
    }
    Message message;
    message.role = Role::Agent;
    message.parts.push_back(protocol::text_part(event.text));
    messages.push_back(std::move(message));
}

void ConversationStateMachine::apply(const protocol::ToolCallStartEvent& event) {
    if (tool_index_.find(event.id) != tool_index_.end()) {
        fail(AgentError{ErrorCategory::Protocol,
                        "Tool call id started twice: " + event.id,
                        "duplicate_tool_call_id"});
        return;
    }

    ToolCall call;
    call.id = event.id;
    call.name = event.name;
    call.arguments = event.arguments;
    call.state = ToolCallState::Started;
    tool_index_.emplace(event.id, snapshot_.tool_calls.size());
    snapshot_.tool_calls.push_back(std::move(call));
    AGENTRUN_LOG_INFO("StateMachine: tool call " + event.id + " (" + event.name +
                      ") started");
}

void ConversationStateMachine::apply(const protocol::ToolCallResultEvent& event) {
    const auto it = tool_index_.find(event.id);
    if (it == tool_index_.end()) {
        fail(AgentError{ErrorCategory::Protocol,
                        "Tool result for unknown tool call id: " + event.id,
                        "unknown_tool_call_id"});
        return;
    }
    ToolCall& call = snapshot_.tool_calls[it->second];
    if (call.state != ToolCallState::Started) {
        fail(AgentError{ErrorCategory::Protocol,
                        "Tool call " + event.id + " already has a result.",
                        "duplicate_tool_call_result"});
        return;
    }

    call.state = event.is_error ? ToolCallState::Failed : ToolCallState::Completed;
    call.result = event.payload;
    AGENTRUN_LOG_INFO("StateMachine: tool call " + event.id + " -> " +
                      protocol::to_string(call.state));

    auto& messages = snapshot_.streamed_messages;
    if (messages.empty() || messages.back().role != Role::Tool) {
        Message message;
        message.role = Role::Tool;
        messages.push_back(std::move(message));
    }
    messages.back().parts.push_back(protocol::tool_result_part(event.id, event.payload));
}

void ConversationStateMachine::apply(const protocol::StatusEvent& event) {
    snapshot_.last_phase = event.phase;
    AGENTRUN_LOG_DEBUG("StateMachine: status " + event.phase);
}

void ConversationStateMachine::apply(const protocol::ErrorEvent& event) {
    fail(AgentError{ErrorCategory::Remote, event.message, event.kind});
}

void ConversationStateMachine::apply(const protocol::FinalEvent&) {
    if (open_tool_calls() > 0) {
        std::string open_ids;
        for (const auto& call : snapshot_.tool_calls) {
            if (call.state != ToolCallState::Started) {
                continue;
            }
            open_ids += open_ids.empty() ? call.id : ", " + call.id;
        }
        fail(AgentError{ErrorCategory::IncompleteToolCall,
                        "Final event arrived with open tool calls: " + open_ids,
                        "incomplete_tool_call"});
        return;
    }
    enter_terminal(MachineState::Completed);
}

void ConversationStateMachine::fail(AgentError error) {
    AGENTRUN_LOG_WARN("StateMachine: " + core::errors::to_string(error.category) +
                      " [" + error.code + "]: " + error.message);
    snapshot_.error = std::move(error);
    enter_terminal(MachineState::Failed);
}

void ConversationStateMachine::enter_terminal(const MachineState next) {
    const std::string prev = to_string(snapshot_.state);
    snapshot_.state = next;
    snapshot_.terminal_ts_unix_ms = current_ts_unix_ms_;
    AGENTRUN_LOG_INFO("StateMachine: " + prev + " -> " + to_string(next));
}

}  // namespace agentrun::runtime
