#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/run_execution_contract.hpp"
#include "protocol/run_log.hpp"
#include "protocol/tool_contract.hpp"

// Persisted (artifact) JSON forms of the protocol types. The remote wire
// format lives in transport/ and decoder/, not here.
namespace agentrun::protocol {

// Replaces invalid UTF-8 sequences with U+FFFD, the same way artifacts are
// dumped, so text held in memory matches what a reload returns.
std::string to_valid_utf8(const std::string& text);

nlohmann::json event_to_json(const Event& event);
core::errors::Result<Event> event_from_json(const nlohmann::json& value);

nlohmann::json tool_call_to_json(const ToolCall& call);
core::errors::Result<ToolCall> tool_call_from_json(const nlohmann::json& value);

nlohmann::json conversation_to_json(const Conversation& conversation);
core::errors::Result<Conversation> conversation_from_json(
    const nlohmann::json& value);

// An error read back from an artifact. Wrapped so that it stays distinct
// from the AgentError describing a failed read.
struct PersistedError {
    core::errors::AgentError error;
};

nlohmann::json error_to_json(const core::errors::AgentError& error);
core::errors::Result<PersistedError> error_from_json(const nlohmann::json& value);

nlohmann::json run_result_to_json(const RunResult& result);
core::errors::Result<RunResult> run_result_from_json(const nlohmann::json& value);

// events.jsonl: one header line followed by one line per entry.
nlohmann::json log_header_to_json(const RunLog& log);
core::errors::Result<RunLog> log_header_from_json(const nlohmann::json& value);
nlohmann::json log_entry_to_json(const LogEntry& entry);
core::errors::Result<LogEntry> log_entry_from_json(const nlohmann::json& value);

}  // namespace agentrun::protocol
