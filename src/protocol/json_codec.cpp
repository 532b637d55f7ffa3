#include "protocol/json_codec.hpp"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace agentrun::protocol {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError malformed(const std::string& what, const std::string& detail) {
    return AgentError{ErrorCategory::Input,
                      "Malformed persisted " + what + ": " + detail,
                      "malformed_artifact"};
}

json optional_string(const std::optional<std::string>& value) {
    return value.has_value() ? json(value.value()) : json(nullptr);
}

std::string role_name(const Role role) {
    return to_string(role);
}

bool role_from_name(const std::string& name, Role& out) {
    if (name == "caller") {
        out = Role::Caller;
    } else if (name == "agent") {
        out = Role::Agent;
    } else if (name == "tool") {
        out = Role::Tool;
    } else {
        return false;
    }
    return true;
}

bool tool_state_from_name(const std::string& name, ToolCallState& out) {
    if (name == "started") {
        out = ToolCallState::Started;
    } else if (name == "completed") {
        out = ToolCallState::Completed;
    } else if (name == "failed") {
        out = ToolCallState::Failed;
    } else {
        return false;
    }
    return true;
}

bool run_status_from_name(const std::string& name, RunStatus& out) {
    if (name == "completed") {
        out = RunStatus::Completed;
    } else if (name == "failed") {
        out = RunStatus::Failed;
    } else if (name == "timed_out") {
        out = RunStatus::TimedOut;
    } else {
        return false;
    }
    return true;
}

json part_to_json(const ContentPart& part) {
    json payload;
    if (part.kind == ContentKind::Text) {
        payload["type"] = "text";
        payload["text"] = part.text;
    } else {
        payload["type"] = "tool_result";
        payload["tool_call_id"] = part.tool_call_id;
        payload["payload"] = part.payload;
    }
    return payload;
}

bool part_from_json(const json& value, ContentPart& out) {
    const std::string type = value.at("type").get<std::string>();
    if (type == "text") {
        out = text_part(value.at("text").get<std::string>());
        return true;
    }
    if (type == "tool_result") {
        out = tool_result_part(value.at("tool_call_id").get<std::string>(),
                               value.value("payload", json()));
        return true;
    }
    return false;
}

// Writes the fields of one event alternative; every alternative must have
// an overload.
struct EventFieldsVisitor {
    json& payload;

    void operator()(const TextDeltaEvent& delta) const { payload["text"] = delta.text; }
    void operator()(const ToolCallStartEvent& start) const {
        payload["id"] = start.id;
        payload["name"] = start.name;
        payload["arguments"] = start.arguments;
    }
    void operator()(const ToolCallResultEvent& result) const {
        payload["id"] = result.id;
        payload["payload"] = result.payload;
        payload["is_error"] = result.is_error;
    }
    void operator()(const StatusEvent& status) const { payload["phase"] = status.phase; }
    void operator()(const ErrorEvent& error) const {
        payload["kind"] = error.kind;
        payload["message"] = error.message;
    }
    void operator()(const FinalEvent&) const {}
};

}  // namespace

std::string to_valid_utf8(const std::string& text) {
    const std::string dumped =
        json(text).dump(-1, ' ', false, json::error_handler_t::replace);
    return json::parse(dumped).get<std::string>();
}

json event_to_json(const Event& event) {
    json payload;
    payload["type"] = event_tag(event);
    std::visit(EventFieldsVisitor{payload}, event);
    return payload;
}

core::errors::Result<Event> event_from_json(const json& value) {
    try {
        const std::string type = value.at("type").get<std::string>();
        if (type == "text_delta") {
            return Event{TextDeltaEvent{value.at("text").get<std::string>()}};
        }
        if (type == "tool_call_start") {
            ToolCallStartEvent start;
            start.id = value.at("id").get<std::string>();
            start.name = value.at("name").get<std::string>();
            start.arguments = value.value("arguments", json::object());
            return Event{std::move(start)};
        }
        if (type == "tool_call_result") {
            ToolCallResultEvent result;
            result.id = value.at("id").get<std::string>();
            result.payload = value.value("payload", json());
            result.is_error = value.value("is_error", false);
            return Event{std::move(result)};
        }
        if (type == "status") {
            return Event{StatusEvent{value.at("phase").get<std::string>()}};
        }
        if (type == "error") {
            return Event{ErrorEvent{value.at("kind").get<std::string>(),
                                    value.at("message").get<std::string>()}};
        }
        if (type == "final") {
            return Event{FinalEvent{}};
        }
        return malformed("event", "unknown type '" + type + "'");
    } catch (const json::exception& e) {
        return malformed("event", e.what());
    }
}

json tool_call_to_json(const ToolCall& call) {
    json payload;
    payload["id"] = call.id;
    payload["name"] = call.name;
    payload["arguments"] = call.arguments;
    payload["state"] = to_string(call.state);
    payload["result"] = call.result;
    return payload;
}

core::errors::Result<ToolCall> tool_call_from_json(const json& value) {
    try {
        ToolCall call;
        call.id = value.at("id").get<std::string>();
        call.name = value.at("name").get<std::string>();
        call.arguments = value.value("arguments", json::object());
        call.result = value.value("result", json());
        if (!tool_state_from_name(value.at("state").get<std::string>(), call.state)) {
            return malformed("tool call", "unknown state for " + call.id);
        }
        return call;
    } catch (const json::exception& e) {
        return malformed("tool call", e.what());
    }
}

json conversation_to_json(const Conversation& conversation) {
    json messages = json::array();
    for (const auto& message : conversation.messages) {
        json parts = json::array();
        for (const auto& part : message.parts) {
            parts.push_back(part_to_json(part));
        }
        messages.push_back({{"role", role_name(message.role)}, {"parts", parts}});
    }
    json payload;
    payload["id"] = conversation.id;
    payload["messages"] = messages;
    return payload;
}

core::errors::Result<Conversation> conversation_from_json(const json& value) {
    try {
        Conversation conversation;
        conversation.id = value.at("id").get<std::string>();
        for (const auto& item : value.at("messages")) {
            Message message;
            if (!role_from_name(item.at("role").get<std::string>(), message.role)) {
                return malformed("conversation", "unknown role");
            }
            for (const auto& item_part : item.at("parts")) {
                ContentPart part;
                if (!part_from_json(item_part, part)) {
                    return malformed("conversation", "unknown content part type");
                }
                message.parts.push_back(std::move(part));
            }
            conversation.messages.push_back(std::move(message));
        }
        return conversation;
    } catch (const json::exception& e) {
        return malformed("conversation", e.what());
    }
}

json error_to_json(const AgentError& error) {
    json payload;
    payload["kind"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    if (!error.hint.empty()) {
        payload["hint"] = error.hint;
    }
    return payload;
}

core::errors::Result<PersistedError> error_from_json(const json& value) {
    try {
        AgentError error{ErrorCategory::Internal, ""};
        if (!core::errors::category_from_string(value.at("kind").get<std::string>(),
                                                error.category)) {
            return malformed("error", "unknown kind");
        }
        error.code = value.at("code").get<std::string>();
        error.message = value.at("message").get<std::string>();
        error.hint = value.value("hint", std::string());
        return PersistedError{std::move(error)};
    } catch (const json::exception& e) {
        return malformed("error", e.what());
    }
}

json run_result_to_json(const RunResult& result) {
    json tool_calls = json::array();
    for (const auto& call : result.tool_calls) {
        tool_calls.push_back(tool_call_to_json(call));
    }
    json events = json::array();
    for (const auto& event : result.events) {
        events.push_back(event_to_json(event));
    }

    json payload;
    payload["run_id"] = result.run_id;
    payload["conversation_id"] = result.conversation_id;
    payload["status"] = to_string(result.status);
    payload["answer"] = result.answer;
    payload["tool_calls"] = tool_calls;
    payload["events"] = events;
    payload["transcript"] = conversation_to_json(result.transcript);
    payload["error"] = result.error.has_value() ? error_to_json(result.error.value())
                                                : json(nullptr);
    payload["last_phase"] = optional_string(result.last_phase);
    payload["dropped_frames"] = result.dropped_frames;
    payload["connection_attempts"] = result.connection_attempts;
    payload["started_at_unix_ms"] = result.started_at_unix_ms;
    payload["ended_at_unix_ms"] = result.ended_at_unix_ms;
    return payload;
}

core::errors::Result<RunResult> run_result_from_json(const json& value) {
    try {
        RunResult result;
        result.run_id = value.at("run_id").get<std::string>();
        result.conversation_id = value.at("conversation_id").get<std::string>();
        if (!run_status_from_name(value.at("status").get<std::string>(),
                                  result.status)) {
            return malformed("result", "unknown status");
        }
        result.answer = value.at("answer").get<std::string>();
        for (const auto& item : value.at("tool_calls")) {
            auto call = tool_call_from_json(item);
            if (core::errors::is_error(call)) {
                return core::errors::get_error(call);
            }
            result.tool_calls.push_back(core::errors::take_value(std::move(call)));
        }
        for (const auto& item : value.at("events")) {
            auto event = event_from_json(item);
            if (core::errors::is_error(event)) {
                return core::errors::get_error(event);
            }
            result.events.push_back(core::errors::take_value(std::move(event)));
        }
        auto transcript = conversation_from_json(value.at("transcript"));
        if (core::errors::is_error(transcript)) {
            return core::errors::get_error(transcript);
        }
        result.transcript = core::errors::take_value(std::move(transcript));
        if (!value.at("error").is_null()) {
            auto error = error_from_json(value.at("error"));
            if (core::errors::is_error(error)) {
                return core::errors::get_error(error);
            }
            result.error = core::errors::get_value(error).error;
        }
        if (!value.at("last_phase").is_null()) {
            result.last_phase = value.at("last_phase").get<std::string>();
        }
        result.dropped_frames = value.at("dropped_frames").get<std::size_t>();
        result.connection_attempts =
            value.at("connection_attempts").get<std::uint32_t>();
        result.started_at_unix_ms = value.at("started_at_unix_ms").get<std::int64_t>();
        result.ended_at_unix_ms = value.at("ended_at_unix_ms").get<std::int64_t>();
        return result;
    } catch (const json::exception& e) {
        return malformed("result", e.what());
    }
}

json log_header_to_json(const RunLog& log) {
    json payload;
    payload["record"] = "header";
    payload["run_id"] = log.run_id;
    payload["conversation"] = conversation_to_json(log.conversation);
    payload["strict"] = log.strict;
    payload["started_at_unix_ms"] = log.started_at_unix_ms;
    payload["connection_attempts"] = log.connection_attempts;
    if (log.abandoned.has_value()) {
        payload["abandoned"] = error_to_json(log.abandoned.value());
        payload["abandoned_at_unix_ms"] = log.abandoned_at_unix_ms;
    }
    return payload;
}

core::errors::Result<RunLog> log_header_from_json(const json& value) {
    try {
        if (value.at("record").get<std::string>() != "header") {
            return malformed("event log", "first record is not a header");
        }
        RunLog log;
        log.run_id = value.at("run_id").get<std::string>();
        auto conversation = conversation_from_json(value.at("conversation"));
        if (core::errors::is_error(conversation)) {
            return core::errors::get_error(conversation);
        }
        log.conversation = core::errors::take_value(std::move(conversation));
        log.strict = value.at("strict").get<bool>();
        log.started_at_unix_ms = value.at("started_at_unix_ms").get<std::int64_t>();
        log.connection_attempts = value.at("connection_attempts").get<std::uint32_t>();
        if (value.contains("abandoned")) {
            auto abandoned = error_from_json(value.at("abandoned"));
            if (core::errors::is_error(abandoned)) {
                return core::errors::get_error(abandoned);
            }
            log.abandoned = core::errors::get_value(abandoned).error;
            log.abandoned_at_unix_ms =
                value.at("abandoned_at_unix_ms").get<std::int64_t>();
        }
        return log;
    } catch (const json::exception& e) {
        return malformed("event log header", e.what());
    }
}

json log_entry_to_json(const LogEntry& entry) {
    json payload;
    payload["seq"] = entry.seq;
    payload["ts_unix_ms"] = entry.ts_unix_ms;
    if (const auto* event = std::get_if<Event>(&entry.body)) {
        payload["record"] = "event";
        payload["event"] = event_to_json(*event);
    } else if (const auto* dropped = std::get_if<DroppedFrame>(&entry.body)) {
        payload["record"] = "dropped_frame";
        payload["raw"] = dropped->raw;
        payload["reason"] = dropped->reason;
    } else if (const auto* end = std::get_if<StreamEnd>(&entry.body)) {
        payload["record"] = "stream_end";
        payload["cause"] = to_string(end->cause);
        payload["detail"] = end->detail;
    }
    return payload;
}

core::errors::Result<LogEntry> log_entry_from_json(const json& value) {
    try {
        LogEntry entry;
        entry.seq = value.at("seq").get<std::uint64_t>();
        entry.ts_unix_ms = value.at("ts_unix_ms").get<std::int64_t>();
        const std::string record = value.at("record").get<std::string>();
        if (record == "event") {
            auto event = event_from_json(value.at("event"));
            if (core::errors::is_error(event)) {
                return core::errors::get_error(event);
            }
            entry.body = core::errors::take_value(std::move(event));
        } else if (record == "dropped_frame") {
            entry.body = DroppedFrame{value.at("raw").get<std::string>(),
                                      value.at("reason").get<std::string>()};
        } else if (record == "stream_end") {
            const std::string cause = value.at("cause").get<std::string>();
            StreamEnd end;
            end.cause = cause == "deadline_exceeded" ? StreamEndCause::DeadlineExceeded
                                                     : StreamEndCause::Closed;
            end.detail = value.value("detail", std::string());
            entry.body = std::move(end);
        } else {
            return malformed("event log entry", "unknown record '" + record + "'");
        }
        return entry;
    } catch (const json::exception& e) {
        return malformed("event log entry", e.what());
    }
}

}  // namespace agentrun::protocol
