#include "cli_parser.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace agentrun::app::cli {

    using namespace agentrun::core::errors;
    using agentrun::protocol::Conversation;
    using agentrun::protocol::Message;
    using agentrun::protocol::Role;
    using agentrun::protocol::ToolChoice;
    using agentrun::protocol::ToolChoiceMode;
    using nlohmann::json;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> endpoint;
        std::vector<std::string> messages;
        std::optional<std::string> conversation_file;
        std::optional<std::string> conversation_id;
        std::vector<std::string> allowed_tools;
        std::optional<std::string> tool_choice;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> max_retries;
        std::optional<std::string> artifacts_dir;
        std::optional<std::string> token_env;
        std::optional<std::string> run_dir;
        bool strict = false;
        bool verbose = false;
    };

    std::optional<std::string> process_env(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    }

    namespace {

    // Exception-free integer parsing with inclusive bounds
    Result<std::uint64_t> parse_bounded(const std::string& flag, const std::string& text,
                                        std::uint64_t min, std::uint64_t max) {
        std::uint64_t value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end) {
            return AgentError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
        }
        if (value < min || value > max) {
            return AgentError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                              "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
        }
        return value;
    }

    bool role_from_text(const std::string& text, Role& out) {
        if (text == "user" || text == "caller") {
            out = Role::Caller;
        } else if (text == "assistant" || text == "agent") {
            out = Role::Agent;
        } else if (text == "tool") {
            out = Role::Tool;
        } else {
            return false;
        }
        return true;
    }

    // A conversation file is a JSON array of {"role": "...", "content": "..."}.
    Result<std::vector<Message>> load_conversation_file(const std::string& file) {
        std::ifstream in(file);
        if (!in.is_open()) {
            return AgentError{ErrorCategory::Input, "Unable to open conversation file: " + file, "invalid_path"};
        }
        const json doc = json::parse(in, nullptr, false);
        if (doc.is_discarded() || !doc.is_array()) {
            return AgentError{ErrorCategory::Input, "Conversation file must be a JSON array: " + file, "invalid_conversation_file"};
        }

        std::vector<Message> messages;
        for (const auto& item : doc) {
            if (!item.is_object() || !item.contains("role") || !item["role"].is_string() ||
                !item.contains("content") || !item["content"].is_string()) {
                return AgentError{ErrorCategory::Input, "Each conversation entry needs string 'role' and 'content'", "invalid_conversation_file"};
            }
            Message message;
            if (!role_from_text(item["role"].get<std::string>(), message.role)) {
                return AgentError{ErrorCategory::Input, "Unknown role in conversation file: " + item["role"].get<std::string>(),
                                  "invalid_conversation_file", "Use user, assistant or tool."};
            }
            message.parts.push_back(protocol::text_part(item["content"].get<std::string>()));
            messages.push_back(std::move(message));
        }
        return messages;
    }

    } // namespace

    Result<CliOptions> parse_and_validate(int argc, char* argv[], const EnvLookup& env) {
        if (argc < 2) {
            return AgentError{ErrorCategory::Input, "No command provided.", "missing_command",
                              "Usage: agentrun run --endpoint URL --message \"...\""};
        }

        CliOptions options;
        std::string command = argv[1];
        if (command == "run") {
            options.command = Command::Run;
        } else if (command == "replay") {
            options.command = Command::Replay;
        } else {
            return AgentError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands: run, replay."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        auto take_value = [&args](std::size_t& i) -> std::optional<std::string> {
            if (i + 1 < args.size()) return args[++i];
            return std::nullopt;
        };
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string flag = args[i];
            if (flag == "--strict") {
                raw.strict = true;
                continue;
            }
            if (flag == "--verbose") {
                raw.verbose = true;
                continue;
            }

            std::optional<std::string>* single = nullptr;
            std::vector<std::string>* repeated = nullptr;
            if (flag == "--endpoint") single = &raw.endpoint;
            else if (flag == "--conversation-file") single = &raw.conversation_file;
            else if (flag == "--conversation-id") single = &raw.conversation_id;
            else if (flag == "--tool-choice") single = &raw.tool_choice;
            else if (flag == "--timeout-ms") single = &raw.timeout_ms;
            else if (flag == "--max-retries") single = &raw.max_retries;
            else if (flag == "--artifacts-dir") single = &raw.artifacts_dir;
            else if (flag == "--token-env") single = &raw.token_env;
            else if (flag == "--run-dir") single = &raw.run_dir;
            else if (flag == "--message") repeated = &raw.messages;
            else if (flag == "--allow-tool") repeated = &raw.allowed_tools;
            else {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }

            auto value = take_value(i);
            if (!value) {
                return AgentError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
            if (single) *single = std::move(*value);
            else repeated->push_back(std::move(*value));
        }

        options.verbose = raw.verbose;

        // 3. Validator Phase: Enforce logic and bounds
        if (options.command == Command::Replay) {
            if (!raw.run_dir) {
                return AgentError{ErrorCategory::Input, "replay requires --run-dir", "missing_required_flag"};
            }
            std::error_code ec;
            if (!std::filesystem::is_directory(raw.run_dir.value(), ec) || ec) {
                return AgentError{ErrorCategory::Input, "Run directory does not exist or is not a directory", "invalid_path"};
            }
            options.run_dir = raw.run_dir.value();
            return options;
        }

        if (raw.run_dir) {
            return AgentError{ErrorCategory::Input, "--run-dir is only valid for replay", "conflicting_flags"};
        }
        if (!raw.endpoint) {
            return AgentError{ErrorCategory::Input, "Must provide --endpoint", "missing_required_flag"};
        }
        if (raw.messages.empty() && !raw.conversation_file) {
            return AgentError{ErrorCategory::Input, "Must provide --message or --conversation-file", "missing_required_flag"};
        }

        protocol::RunRequest& req = options.request;
        req.endpoint = raw.endpoint.value();
        req.decode.strict = raw.strict;

        Conversation conversation;
        if (raw.conversation_id) conversation.id = raw.conversation_id.value();
        if (raw.conversation_file) {
            auto loaded = load_conversation_file(raw.conversation_file.value());
            if (is_error(loaded)) {
                return get_error(loaded);
            }
            conversation.messages = get_value(loaded);
        }
        for (const auto& text : raw.messages) {
            conversation.messages.push_back(protocol::caller_message(text));
        }
        req.conversation = std::move(conversation);

        if (raw.tool_choice || !raw.allowed_tools.empty()) {
            ToolChoice choice;
            if (raw.tool_choice) {
                if (raw.tool_choice.value() == "auto") choice.mode = ToolChoiceMode::Auto;
                else if (raw.tool_choice.value() == "none") choice.mode = ToolChoiceMode::None;
                else {
                    return AgentError{ErrorCategory::Input, "Invalid --tool-choice: " + raw.tool_choice.value(), "invalid_tool_choice", "Use auto or none."};
                }
            }
            choice.allowed.insert(raw.allowed_tools.begin(), raw.allowed_tools.end());
            req.tool_choice = std::move(choice);
        }

        if (raw.timeout_ms) {
            auto timeout = parse_bounded("--timeout-ms", raw.timeout_ms.value(), 1, 86400000);
            if (is_error(timeout)) return get_error(timeout);
            req.timeout = std::chrono::milliseconds(get_value(timeout));
        }
        if (raw.max_retries) {
            auto retries = parse_bounded("--max-retries", raw.max_retries.value(), 0, 20);
            if (is_error(retries)) return get_error(retries);
            req.retry.max_retries = static_cast<std::uint32_t>(get_value(retries));
        }
        if (raw.artifacts_dir) {
            req.artifact_root = std::filesystem::path(raw.artifacts_dir.value());
        }

        // Credentials come from the environment only, never from argv.
        const std::string token_env = raw.token_env.value_or(kDefaultTokenEnv);
        const auto token = env(token_env);
        if (!token || token->empty()) {
            return AgentError{ErrorCategory::Input, "No credentials found in $" + token_env, "missing_credentials",
                              "Export the agent service token in " + token_env + "."};
        }
        req.credentials = token.value();

        return options;
    }

} // namespace agentrun::app::cli
