#include "runtime/result_aggregator.hpp"

namespace agentrun::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::RunResult;
using protocol::RunStatus;

RunResult aggregate(const ConversationSnapshot& snapshot,
                    const protocol::RunLog& log) {
    RunResult result;
    result.run_id = log.run_id;
    result.conversation_id = log.conversation.id;
    result.answer = snapshot.answer;
    result.tool_calls = snapshot.tool_calls;
    result.events = snapshot.events;
    result.error = snapshot.error;
    result.last_phase = snapshot.last_phase;
    result.dropped_frames = snapshot.dropped_frames;
    result.connection_attempts = log.connection_attempts;
    result.started_at_unix_ms = log.started_at_unix_ms;

    result.transcript = log.conversation;
    for (const auto& message : snapshot.streamed_messages) {
        result.transcript.messages.push_back(message);
    }

    switch (snapshot.state) {
        case MachineState::Completed:
            result.status = RunStatus::Completed;
            break;
        case MachineState::TimedOut:
            result.status = RunStatus::TimedOut;
            break;
        case MachineState::Failed:
            result.status = RunStatus::Failed;
            break;
        case MachineState::Idle:
        case MachineState::Streaming:
            result.status = RunStatus::Failed;
            if (log.abandoned.has_value()) {
                result.error = log.abandoned;
            } else if (!result.error.has_value()) {
                result.error = AgentError{ErrorCategory::Internal,
                                          "Run was aggregated before reaching a "
                                          "terminal state.",
                                          "run_not_terminal"};
            }
            break;
    }

    if (snapshot.terminal_ts_unix_ms.has_value()) {
        result.ended_at_unix_ms = snapshot.terminal_ts_unix_ms.value();
    } else if (log.abandoned.has_value()) {
        result.ended_at_unix_ms = log.abandoned_at_unix_ms;
    } else if (!log.entries.empty()) {
        result.ended_at_unix_ms = log.entries.back().ts_unix_ms;
    } else {
        result.ended_at_unix_ms = log.started_at_unix_ms;
    }
    return result;
}

RunResult replay(const protocol::RunLog& log) {
    ConversationStateMachine machine(protocol::DecodePolicy{log.strict});
    for (const auto& entry : log.entries) {
        if (machine.is_terminal()) {
            break;
        }
        machine.consume(entry);
    }

    if (!machine.is_terminal() && !log.abandoned.has_value()) {
        protocol::LogEntry end;
        end.seq = log.entries.empty() ? 0 : log.entries.back().seq + 1;
        end.ts_unix_ms = log.entries.empty() ? log.started_at_unix_ms
                                             : log.entries.back().ts_unix_ms;
        end.body = protocol::StreamEnd{protocol::StreamEndCause::Closed,
                                       "Event log has no terminal record."};
        machine.consume(end);
    }
    return aggregate(machine.snapshot(), log);
}

}  // namespace agentrun::runtime
