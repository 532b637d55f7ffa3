#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include "core/errors/agent_errors.hpp"
#include "decoder/event_decoder.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/run_execution_contract.hpp"
#include "protocol/run_request.hpp"
#include "transport/frame_source.hpp"

namespace agentrun::session {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Top-level entry point: runs one conversation end to end.
//
// Connection failures are retried with exponential backoff only while no
// event has been decoded; once streaming has begun, every failure ends the
// run with a Failed or TimedOut RunResult instead. Each run that starts is
// persisted exactly once, whatever its outcome.
//
// The controller holds no per-run state, so one instance may serve
// concurrent runs as long as the transport allows it.
class SessionController {
public:
    // `transport` must outlive the controller.
    explicit SessionController(transport::Transport& transport,
                               Sleeper sleeper = nullptr);

    // Returns an error only for an invalid request (nothing is persisted) or
    // when connection retries are exhausted before any stream opened (the
    // failed run is still persisted).
    core::errors::Result<protocol::RunResult> run_conversation(
        const protocol::RunRequest& request) const;

    static std::chrono::milliseconds backoff_delay(
        const protocol::RetryPolicy& policy, std::uint32_t retry_index);

private:
    core::errors::Result<protocol::RunRequest> validate(
        const protocol::RunRequest& request) const;

    transport::Transport& transport_;
    Sleeper sleeper_;
    decoder::EventDecoder decoder_;
    policy::PolicyGuard guard_;
};

}  // namespace agentrun::session
