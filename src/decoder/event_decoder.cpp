#include "decoder/event_decoder.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/json_codec.hpp"

namespace agentrun::decoder {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::Event;

namespace {

constexpr const char* kTextDelta = "response.text.delta";
constexpr const char* kToolUse = "response.tool_use";
constexpr const char* kToolResult = "response.tool_result";
constexpr const char* kStatus = "response.status";
constexpr const char* kError = "error";
constexpr const char* kFinal = "response";

AgentError decode_error(const transport::Frame& frame, const std::string& reason) {
    return AgentError{ErrorCategory::Decode,
                      protocol::to_valid_utf8("Malformed '" + frame.event + "' frame: " + reason),
                      "malformed_frame", protocol::to_valid_utf8(frame.raw)};
}

// Tool ids arrive as strings or integers; integers normalize to decimal.
bool read_tool_id(const json& payload, std::string& out) {
    const auto it = payload.find("tool_use_id");
    if (it == payload.end()) {
        return false;
    }
    if (it->is_string()) {
        out = it->get<std::string>();
        return !out.empty();
    }
    if (it->is_number_integer()) {
        out = it->dump();
        return true;
    }
    return false;
}

bool read_string(const json& payload, const char* key, std::string& out) {
    const auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

}  // namespace

core::errors::Result<Event> EventDecoder::decode(const transport::Frame& frame) const {
    const std::string& name = frame.event;
    const bool known = name == kTextDelta || name == kToolUse ||
                       name == kToolResult || name == kStatus ||
                       name == kError || name == kFinal;
    if (!known) {
        return Event{protocol::StatusEvent{protocol::kUnknownPhase}};
    }

    // The final "response" event may carry an aggregated body or none.
    if (name == kFinal && frame.data.empty()) {
        return Event{protocol::FinalEvent{}};
    }

    const json payload = json::parse(frame.data, nullptr, false);
    if (payload.is_discarded()) {
        return decode_error(frame, "data is not valid JSON");
    }
    if (!payload.is_object()) {
        return decode_error(frame, "data is not a JSON object");
    }

    if (name == kTextDelta) {
        protocol::TextDeltaEvent delta;
        if (!read_string(payload, "text", delta.text)) {
            return decode_error(frame, "missing string field 'text'");
        }
        return Event{std::move(delta)};
    }

    if (name == kToolUse) {
        protocol::ToolCallStartEvent start;
        if (!read_tool_id(payload, start.id)) {
            return decode_error(frame, "missing or invalid 'tool_use_id'");
        }
        if (!read_string(payload, "name", start.name) || start.name.empty()) {
            return decode_error(frame, "missing string field 'name'");
        }
        const auto input = payload.find("input");
        if (input != payload.end() && !input->is_null()) {
            start.arguments = *input;
        }
        return Event{std::move(start)};
    }

    if (name == kToolResult) {
        protocol::ToolCallResultEvent result;
        if (!read_tool_id(payload, result.id)) {
            return decode_error(frame, "missing or invalid 'tool_use_id'");
        }
        const auto content = payload.find("content");
        if (content == payload.end()) {
            return decode_error(frame, "missing field 'content'");
        }
        result.payload = *content;
        std::string status;
        result.is_error = read_string(payload, "status", status) && status == "error";
        return Event{std::move(result)};
    }

    if (name == kStatus) {
        protocol::StatusEvent status;
        if (!read_string(payload, "status", status.phase)) {
            return decode_error(frame, "missing string field 'status'");
        }
        return Event{std::move(status)};
    }

    if (name == kError) {
        protocol::ErrorEvent error;
        if (!read_string(payload, "message", error.message)) {
            return decode_error(frame, "missing string field 'message'");
        }
        const auto code = payload.find("code");
        if (code != payload.end() && code->is_string()) {
            error.kind = code->get<std::string>();
        } else if (code != payload.end() && code->is_number()) {
            error.kind = code->dump();
        } else {
            error.kind = "agent_error";
        }
        return Event{std::move(error)};
    }

    return Event{protocol::FinalEvent{}};
}

}  // namespace agentrun::decoder
