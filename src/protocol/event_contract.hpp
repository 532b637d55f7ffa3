#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace agentrun::protocol {

    // The closed set of events the remote agent emits during one run.
    struct TextDeltaEvent { std::string text; };
    struct ToolCallStartEvent {
        std::string id;
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
    };
    struct ToolCallResultEvent {
        std::string id;
        nlohmann::json payload;
        bool is_error = false;  // the tool itself reported a failure
    };
    // Unrecognized event tags decode to Status{"unknown"}.
    struct StatusEvent { std::string phase; };
    struct ErrorEvent {
        std::string kind;
        std::string message;
    };
    struct FinalEvent {};

    // Exactly ONE of the types below. Visitors over this variant must handle
    // every alternative, which keeps the state machine transition table
    // exhaustive.
    using Event = std::variant<
        TextDeltaEvent,
        ToolCallStartEvent,
        ToolCallResultEvent,
        StatusEvent,
        ErrorEvent,
        FinalEvent
    >;

    inline constexpr const char* kUnknownPhase = "unknown";

    // Stable tag names used in persisted logs. One overload per alternative
    // so a new event type cannot be left without a tag.
    struct EventTagVisitor {
        const char* operator()(const TextDeltaEvent&) const { return "text_delta"; }
        const char* operator()(const ToolCallStartEvent&) const { return "tool_call_start"; }
        const char* operator()(const ToolCallResultEvent&) const { return "tool_call_result"; }
        const char* operator()(const StatusEvent&) const { return "status"; }
        const char* operator()(const ErrorEvent&) const { return "error"; }
        const char* operator()(const FinalEvent&) const { return "final"; }
    };

    inline std::string event_tag(const Event& event) {
        return std::visit(EventTagVisitor{}, event);
    }

} // namespace agentrun::protocol
