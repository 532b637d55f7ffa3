#pragma once
#include <string>
#include <utility>
#include <variant>

namespace agentrun::core::errors {

    // 1. Typed error categories. The first block mirrors the run failure
    // taxonomy; Input, Remote and Internal cover everything around it.
    enum class ErrorCategory {
        Connection,             // Transport could not open the stream
        Decode,                 // One frame could not be parsed
        Protocol,               // Duplicate or unmatched tool-call ids
        IncompleteToolCall,     // Final arrived while a tool call was open
        UnexpectedEndOfStream,  // Stream closed without Final or Error
        Timeout,                // Overall run deadline exceeded
        Persistence,            // Artifact could not be written
        Remote,                 // The agent reported an Error event
        Input,                  // Bad flag, bad request, bad file
        Internal                // Logic bug or unexpected library failure
    };

    // The standardized error payload
    struct AgentError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";  // Helpful tips for the user
    };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    // Kind names as they appear in logs and persisted artifacts.
    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Connection: return "ConnectionError";
            case ErrorCategory::Decode: return "DecodeError";
            case ErrorCategory::Protocol: return "ProtocolError";
            case ErrorCategory::IncompleteToolCall: return "IncompleteToolCall";
            case ErrorCategory::UnexpectedEndOfStream: return "UnexpectedEndOfStream";
            case ErrorCategory::Timeout: return "TimeoutError";
            case ErrorCategory::Persistence: return "PersistenceError";
            case ErrorCategory::Remote: return "RemoteError";
            case ErrorCategory::Input: return "InputError";
            case ErrorCategory::Internal: return "InternalError";
            default: return "UnknownError";
        }
    }

    inline bool category_from_string(const std::string& text, ErrorCategory& out) {
        static const ErrorCategory kAll[] = {
            ErrorCategory::Connection, ErrorCategory::Decode,
            ErrorCategory::Protocol, ErrorCategory::IncompleteToolCall,
            ErrorCategory::UnexpectedEndOfStream, ErrorCategory::Timeout,
            ErrorCategory::Persistence, ErrorCategory::Remote,
            ErrorCategory::Input, ErrorCategory::Internal};
        for (const auto category : kAll) {
            if (to_string(category) == text) {
                out = category;
                return true;
            }
        }
        return false;
    }

} // namespace agentrun::core::errors
