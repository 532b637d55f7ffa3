#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/run_request.hpp"

namespace agentrun::app::cli {

    enum class Command {
        Run,
        Replay
    };

    struct CliOptions {
        Command command = Command::Run;
        protocol::RunRequest request;        // Run only
        std::filesystem::path run_dir;       // Replay only
        bool verbose = false;
    };

    // Environment access is injectable so tests never touch the real one.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    inline constexpr const char* kDefaultTokenEnv = "AGENTRUN_API_TOKEN";

    std::optional<std::string> process_env(const std::string& name);

    agentrun::core::errors::Result<CliOptions> parse_and_validate(
        int argc, char* argv[], const EnvLookup& env = process_env);

} // namespace agentrun::app::cli
