#pragma once
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace agentrun::protocol {

    enum class ToolCallState {
        Started,
        Completed,
        Failed
    };

    // An agent-initiated tool invocation, tracked from start to result.
    struct ToolCall {
        std::string id;
        std::string name;                   // e.g. "search", "analyst"
        nlohmann::json arguments = nlohmann::json::object();
        ToolCallState state = ToolCallState::Started;
        nlohmann::json result;              // set once Completed
    };

    enum class ToolChoiceMode {
        Auto,
        None
    };

    // Optional constraint sent with the request: which tools the agent may
    // use, and whether it may use any at all.
    struct ToolChoice {
        ToolChoiceMode mode = ToolChoiceMode::Auto;
        std::set<std::string> allowed;      // empty + Auto = any tool
    };

    inline std::string to_string(const ToolCallState state) {
        switch (state) {
            case ToolCallState::Started:   return "started";
            case ToolCallState::Completed: return "completed";
            case ToolCallState::Failed:    return "failed";
            default: return "unknown";
        }
    }

    inline std::string to_string(const ToolChoiceMode mode) {
        return mode == ToolChoiceMode::None ? "none" : "auto";
    }

} // namespace agentrun::protocol
