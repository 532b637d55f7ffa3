#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace agentrun::transport {

using Clock = std::chrono::steady_clock;

// One raw record received from the stream, before decoding.
struct Frame {
    std::string event;  // SSE "event:" field, empty when absent
    std::string data;   // SSE "data:" lines joined with '\n'
    std::string id;
    std::string raw;    // the block as received, for diagnostics
};

enum class PullStatus {
    FrameReady,
    EndOfStream,
    DeadlineExceeded
};

struct Pull {
    PullStatus status = PullStatus::EndOfStream;
    Frame frame;
};

// Lazy, finite sequence of frames. next() is the only suspension point of a
// run and must return no later than `deadline`. An error result means the
// connection failed while reading.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual core::errors::Result<Pull> next(Clock::time_point deadline) = 0;

    // Idempotent. After close(), next() reports EndOfStream.
    virtual void close() = 0;
};

struct StreamRequest {
    std::string endpoint;
    std::string credentials;
    std::string run_id;
    protocol::Conversation conversation;
    std::optional<protocol::ToolChoice> tool_choice;
};

// Opens streams. Failures to establish one are Connection errors, or Timeout
// when `deadline` passes first; this layer never retries.
class Transport {
public:
    virtual ~Transport() = default;

    virtual core::errors::Result<std::unique_ptr<FrameSource>> open(
        const StreamRequest& request, Clock::time_point deadline) = 0;
};

}  // namespace agentrun::transport
