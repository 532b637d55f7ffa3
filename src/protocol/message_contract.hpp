#pragma once
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentrun::protocol {

    enum class Role {
        Caller,
        Agent,
        Tool
    };

    enum class ContentKind {
        Text,
        ToolResult
    };

    // One part of a message: either text or a structured tool-result payload.
    struct ContentPart {
        ContentKind kind = ContentKind::Text;
        std::string text;
        std::string tool_call_id;   // ToolResult only
        nlohmann::json payload;     // ToolResult only
    };

    struct Message {
        Role role = Role::Caller;
        std::vector<ContentPart> parts;
    };

    // Messages exchanged so far, in order. Append-only within a run.
    struct Conversation {
        std::string id;
        std::vector<Message> messages;
    };

    inline ContentPart text_part(std::string text) {
        ContentPart part;
        part.kind = ContentKind::Text;
        part.text = std::move(text);
        return part;
    }

    inline ContentPart tool_result_part(std::string tool_call_id, nlohmann::json payload) {
        ContentPart part;
        part.kind = ContentKind::ToolResult;
        part.tool_call_id = std::move(tool_call_id);
        part.payload = std::move(payload);
        return part;
    }

    inline Message caller_message(std::string text) {
        Message message;
        message.role = Role::Caller;
        message.parts.push_back(text_part(std::move(text)));
        return message;
    }

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::Caller: return "caller";
            case Role::Agent:  return "agent";
            case Role::Tool:   return "tool";
            default: return "unknown";
        }
    }

} // namespace agentrun::protocol
