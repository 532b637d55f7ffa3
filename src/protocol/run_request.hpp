#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace agentrun::protocol {

    // Bounded exponential backoff between pre-stream connection attempts.
    struct RetryPolicy {
        std::uint32_t max_retries = 3;
        std::chrono::milliseconds initial_backoff{250};
        std::chrono::milliseconds max_backoff{5000};
        double multiplier = 2.0;
    };

    struct DecodePolicy {
        // When set, a malformed frame fails the run instead of being dropped.
        bool strict = false;
    };

    // Everything one run needs, passed explicitly rather than read from
    // globals so independent runs can execute side by side.
    struct RunRequest {
        std::string endpoint;           // e.g. https://host/api/v2/agent:run
        std::string credentials;        // bearer token, sourced by the caller
        Conversation conversation;      // id generated when empty
        std::optional<ToolChoice> tool_choice;
        std::chrono::milliseconds timeout{120000};
        RetryPolicy retry;
        DecodePolicy decode;
        std::filesystem::path artifact_root = ".agentrun";
    };

} // namespace agentrun::protocol
