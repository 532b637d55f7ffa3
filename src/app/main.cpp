#include <filesystem>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/result_aggregator.hpp"
#include "session/artifact_writer.hpp"
#include "session/session_controller.hpp"
#include "transport/http_transport.hpp"

namespace {

using agentrun::core::errors::AgentError;
using agentrun::core::errors::ErrorCategory;
using agentrun::core::errors::get_error;
using agentrun::core::errors::get_value;
using agentrun::core::errors::is_error;
using agentrun::protocol::RunResult;
using agentrun::protocol::RunStatus;

constexpr int kExitCompleted = 0;
constexpr int kExitFailed = 1;
constexpr int kExitInput = 2;
constexpr int kExitConnection = 3;
constexpr int kExitTimedOut = 4;
constexpr int kExitArtifactRead = 6;

void report(const AgentError& err) {
    AGENTRUN_LOG_ERROR(agentrun::core::errors::to_string(err.category) + " [" +
                       err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        AGENTRUN_LOG_INFO("Hint: " + err.hint);
    }
}

int exit_code_for(const RunStatus status) {
    switch (status) {
        case RunStatus::Completed: return kExitCompleted;
        case RunStatus::TimedOut: return kExitTimedOut;
        case RunStatus::Failed:
        default: return kExitFailed;
    }
}

void print_result(const RunResult& result) {
    nlohmann::json out = agentrun::protocol::run_result_to_json(result);
    if (result.artifact_dir.has_value()) {
        out["artifact_dir"] = result.artifact_dir->string();
    }
    std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

int run_command(const agentrun::app::cli::CliOptions& options) {
    agentrun::transport::HttpTransport transport;
    agentrun::session::SessionController controller(transport);

    auto outcome = controller.run_conversation(options.request);
    if (is_error(outcome)) {
        const auto& err = get_error(outcome);
        report(err);
        return err.category == ErrorCategory::Input ? kExitInput : kExitConnection;
    }

    const auto& result = get_value(outcome);
    if (result.persistence_error.has_value()) {
        report(result.persistence_error.value());
    } else if (result.artifact_dir.has_value()) {
        AGENTRUN_LOG_INFO("Artifacts: " + result.artifact_dir->string());
    }
    if (result.error.has_value()) {
        report(result.error.value());
    }
    print_result(result);
    return exit_code_for(result.status);
}

int replay_command(const agentrun::app::cli::CliOptions& options) {
    auto loaded = agentrun::session::load_run_log(options.run_dir);
    if (is_error(loaded)) {
        report(get_error(loaded));
        return kExitArtifactRead;
    }
    const auto& log = get_value(loaded);
    agentrun::core::logging::ScopedRunTag tag(log.run_id);

    RunResult replayed = agentrun::runtime::replay(log);
    replayed.artifact_dir = options.run_dir;

    // The stored result is the reference; a mismatch means the log and the
    // result were not written by the same run.
    auto stored = agentrun::session::load_result(options.run_dir);
    if (is_error(stored)) {
        const auto& err = get_error(stored);
        AGENTRUN_LOG_WARN("Replay: stored result unavailable [" + err.code +
                          "]: " + err.message);
    } else if (agentrun::protocol::run_result_to_json(get_value(stored)) !=
               agentrun::protocol::run_result_to_json(replayed)) {
        AGENTRUN_LOG_WARN("Replay: reconstructed result differs from " +
                          std::string(agentrun::session::kResultFile));
    } else {
        AGENTRUN_LOG_DEBUG("Replay: reconstructed result matches stored result");
    }

    print_result(replayed);
    return exit_code_for(replayed.status);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = agentrun::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        report(get_error(parsed));
        return kExitInput;
    }

    const auto& options = get_value(parsed);
    if (options.verbose) {
        agentrun::core::logging::Logger::get().set_min_level(
            agentrun::core::logging::LogLevel::DEBUG);
    }

    if (options.command == agentrun::app::cli::Command::Replay) {
        return replay_command(options);
    }
    return run_command(options);
}
