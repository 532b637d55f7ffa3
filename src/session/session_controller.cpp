#include "session/session_controller.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"
#include "protocol/run_log.hpp"
#include "runtime/conversation_state_machine.hpp"
#include "runtime/result_aggregator.hpp"
#include "session/artifact_writer.hpp"
#include "transport/http_transport.hpp"

namespace agentrun::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::RunLog;
using protocol::RunRequest;
using protocol::RunResult;
using protocol::StreamEnd;
using protocol::StreamEndCause;
using runtime::ConversationStateMachine;
using transport::Clock;

namespace {

enum class AttemptOutcome {
    Finished,    // the state machine reached a terminal state
    Retryable,   // connection failed before any event; try again
    Abandoned    // pre-stream failure that retrying cannot fix
};

struct Attempt {
    AttemptOutcome outcome = AttemptOutcome::Finished;
    std::optional<AgentError> error;
};

// Everything one run mutates. Lives on the stack of run_conversation().
struct RunContext {
    RunLog log;
    ConversationStateMachine machine;
    transport::StreamRequest stream_request;
    Clock::time_point deadline;

    void record(protocol::LogBody body) {
        protocol::LogEntry entry;
        entry.seq = log.entries.size();
        entry.ts_unix_ms = protocol::now_unix_ms();
        entry.body = std::move(body);
        machine.consume(entry);
        log.entries.push_back(std::move(entry));
    }

    void restart(const protocol::DecodePolicy& policy) {
        log.entries.clear();
        machine = ConversationStateMachine(policy);
    }
};

void default_sleep(const std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

}  // namespace

SessionController::SessionController(transport::Transport& transport, Sleeper sleeper)
    : transport_(transport),
      sleeper_(sleeper ? std::move(sleeper) : Sleeper(default_sleep)) {}

std::chrono::milliseconds SessionController::backoff_delay(
    const protocol::RetryPolicy& policy, const std::uint32_t retry_index) {
    const double base = static_cast<double>(policy.initial_backoff.count());
    const double cap = static_cast<double>(policy.max_backoff.count());
    const double scaled =
        base * std::pow(std::max(policy.multiplier, 1.0), static_cast<double>(retry_index));
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::min(scaled, cap)));
}

core::errors::Result<RunRequest> SessionController::validate(
    const RunRequest& request) const {
    if (request.endpoint.empty()) {
        return AgentError{ErrorCategory::Input, "Endpoint is required.",
                          "missing_endpoint"};
    }
    auto endpoint = transport::parse_endpoint(request.endpoint);
    if (core::errors::is_error(endpoint)) {
        return core::errors::get_error(endpoint);
    }
    if (request.conversation.messages.empty()) {
        return AgentError{ErrorCategory::Input,
                          "Conversation must contain at least one message.",
                          "empty_conversation"};
    }
    if (request.timeout.count() <= 0) {
        return AgentError{ErrorCategory::Input, "Timeout must be positive.",
                          "invalid_timeout"};
    }
    if (request.tool_choice.has_value()) {
        auto choice = guard_.validate_tool_choice(request.tool_choice.value());
        if (core::errors::is_error(choice)) {
            return core::errors::get_error(choice);
        }
    }

    RunRequest normalized = request;
    if (normalized.conversation.id.empty()) {
        normalized.conversation.id = core::config::generate_conversation_id();
    }
    return normalized;
}

core::errors::Result<RunResult> SessionController::run_conversation(
    const RunRequest& raw_request) const {
    auto validated = validate(raw_request);
    if (core::errors::is_error(validated)) {
        const auto& err = core::errors::get_error(validated);
        AGENTRUN_LOG_ERROR("SessionController: rejected request [" + err.code +
                           "]: " + err.message);
        return err;
    }
    const RunRequest& request = core::errors::get_value(validated);

    const std::string run_id = core::config::generate_run_id();
    core::logging::ScopedRunTag tag(run_id);
    AGENTRUN_LOG_INFO("SessionController: run started for conversation " +
                      request.conversation.id);

    RunContext ctx{RunLog{}, ConversationStateMachine(request.decode),
                   transport::StreamRequest{}, Clock::now() + request.timeout};
    ctx.log.run_id = run_id;
    ctx.log.conversation = request.conversation;
    ctx.log.strict = request.decode.strict;
    ctx.log.started_at_unix_ms = protocol::now_unix_ms();
    ctx.stream_request.endpoint = request.endpoint;
    ctx.stream_request.credentials = request.credentials;
    ctx.stream_request.run_id = run_id;
    ctx.stream_request.conversation = request.conversation;
    ctx.stream_request.tool_choice = request.tool_choice;

    auto stream_once = [this, &ctx, &request]() -> Attempt {
        auto opened = transport_.open(ctx.stream_request, ctx.deadline);
        if (core::errors::is_error(opened)) {
            const auto& err = core::errors::get_error(opened);
            if (err.category == ErrorCategory::Timeout) {
                ctx.record(StreamEnd{StreamEndCause::DeadlineExceeded, err.message});
                return Attempt{};
            }
            if (err.category == ErrorCategory::Connection) {
                return Attempt{AttemptOutcome::Retryable, err};
            }
            return Attempt{AttemptOutcome::Abandoned, err};
        }
        std::unique_ptr<transport::FrameSource> source =
            core::errors::take_value(std::move(opened));

        while (!ctx.machine.is_terminal()) {
            if (Clock::now() >= ctx.deadline) {
                ctx.record(StreamEnd{StreamEndCause::DeadlineExceeded, ""});
                break;
            }

            auto pulled = source->next(ctx.deadline);
            if (core::errors::is_error(pulled)) {
                const auto& err = core::errors::get_error(pulled);
                if (!ctx.machine.has_observed_event() &&
                    err.category == ErrorCategory::Connection) {
                    source->close();
                    ctx.restart(request.decode);
                    return Attempt{AttemptOutcome::Retryable, err};
                }
                ctx.record(StreamEnd{StreamEndCause::Closed, err.message});
                break;
            }

            const auto& pull = core::errors::get_value(pulled);
            if (pull.status == transport::PullStatus::DeadlineExceeded) {
                ctx.record(StreamEnd{StreamEndCause::DeadlineExceeded, ""});
                break;
            }
            if (pull.status == transport::PullStatus::EndOfStream) {
                ctx.record(StreamEnd{StreamEndCause::Closed, ""});
                break;
            }

            auto decoded = decoder_.decode(pull.frame);
            if (core::errors::is_error(decoded)) {
                const auto& err = core::errors::get_error(decoded);
                ctx.record(protocol::DroppedFrame{protocol::to_valid_utf8(pull.frame.raw), err.message});
                continue;
            }
            const auto& event = core::errors::get_value(decoded);
            if (const auto* start = std::get_if<protocol::ToolCallStartEvent>(&event)) {
                if (!policy::PolicyGuard::is_tool_permitted(request.tool_choice,
                                                            start->name)) {
                    AGENTRUN_LOG_WARN("SessionController: agent called tool '" +
                                      start->name +
                                      "' outside the requested tool choice");
                }
            }
            ctx.record(event);
        }

        // Closing is the only cancellation primitive.
        source->close();
        return Attempt{};
    };

    std::optional<AgentError> abandoned;
    std::uint32_t failures = 0;
    while (true) {
        ++ctx.log.connection_attempts;
        AGENTRUN_LOG_INFO("SessionController: connection attempt " +
                          std::to_string(ctx.log.connection_attempts));
        Attempt attempt = stream_once();
        if (attempt.outcome == AttemptOutcome::Finished) {
            break;
        }

        const AgentError& err = attempt.error.value();
        if (attempt.outcome == AttemptOutcome::Abandoned) {
            abandoned = err;
            break;
        }

        ++failures;
        AGENTRUN_LOG_WARN("SessionController: attempt " +
                          std::to_string(ctx.log.connection_attempts) + " failed [" +
                          err.code + "]: " + err.message);
        if (failures > request.retry.max_retries) {
            abandoned = AgentError{
                ErrorCategory::Connection,
                "Unable to open the agent stream after " +
                    std::to_string(ctx.log.connection_attempts) +
                    " attempts: " + err.message,
                err.code, err.hint};
            break;
        }

        // Rounded up so a sleep of `remaining` always reaches the deadline.
        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
            ctx.deadline - Clock::now());
        const auto delay = std::min(backoff_delay(request.retry, failures - 1), remaining);
        if (delay.count() > 0) {
            AGENTRUN_LOG_INFO("SessionController: retrying in " +
                              std::to_string(delay.count()) + " ms");
            sleeper_(delay);
        }
        if (Clock::now() >= ctx.deadline) {
            ctx.record(StreamEnd{StreamEndCause::DeadlineExceeded,
                                 "Deadline passed while retrying: " + err.message});
            break;
        }
    }

    if (abandoned.has_value()) {
        ctx.log.abandoned = abandoned;
        ctx.log.abandoned_at_unix_ms = protocol::now_unix_ms();
    }

    RunResult result = runtime::aggregate(ctx.machine.snapshot(), ctx.log);
    AGENTRUN_LOG_INFO("SessionController: run finished with status " +
                      protocol::to_string(result.status));

    ArtifactWriter writer(request.artifact_root);
    auto persisted = writer.persist(ctx.log, result);
    if (core::errors::is_error(persisted)) {
        const auto& err = core::errors::get_error(persisted);
        AGENTRUN_LOG_ERROR("SessionController: persistence failed [" + err.code +
                           "]: " + err.message);
        result.persistence_error = err;
    } else {
        result.artifact_dir = core::errors::get_value(persisted);
    }

    if (abandoned.has_value()) {
        AGENTRUN_LOG_ERROR("SessionController: " + abandoned->message);
        return abandoned.value();
    }
    return result;
}

}  // namespace agentrun::session
