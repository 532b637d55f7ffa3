#include "session/artifact_writer.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"

namespace agentrun::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

// Removes the staging directory on every exit path unless released.
class StagingDirectory {
public:
    explicit StagingDirectory(std::filesystem::path path) : path_(std::move(path)) {}

    ~StagingDirectory() {
        if (released_) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            AGENTRUN_LOG_WARN("ArtifactWriter: unable to remove staging directory " +
                              path_.string() + ": " + ec.message());
        }
    }

    StagingDirectory(const StagingDirectory&) = delete;
    StagingDirectory& operator=(const StagingDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    void release() { released_ = true; }

private:
    std::filesystem::path path_;
    bool released_ = false;
};

std::string to_line(const json& value) {
    // Raw frames may carry invalid UTF-8; replace rather than throw.
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<std::filesystem::path> write_text(
    const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to open artifact file: " + path.string(),
                          "artifact_open_failed"};
    }
    out << text;
    out.flush();
    if (!out.good()) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to write artifact file: " + path.string(),
                          "artifact_write_failed"};
    }
    return path;
}

std::string render_event_log(const protocol::RunLog& log) {
    std::string text = to_line(protocol::log_header_to_json(log));
    text.push_back('\n');
    for (const auto& entry : log.entries) {
        text += to_line(protocol::log_entry_to_json(entry));
        text.push_back('\n');
    }
    return text;
}

}  // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path artifact_root)
    : artifact_root_(std::move(artifact_root)) {}

core::errors::Result<std::filesystem::path> ArtifactWriter::run_dir(
    const std::string& run_id) const {
    if (!core::config::is_path_safe_id(run_id)) {
        return AgentError{ErrorCategory::Persistence,
                          "Run ID is not usable as a directory name: '" + run_id + "'",
                          "invalid_run_id"};
    }

    std::error_code ec;
    std::filesystem::create_directories(artifact_root_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to create artifact root: " +
                              artifact_root_.string(),
                          "artifact_dir_create_failed"};
    }
    return guard_.validate_path_in_root(artifact_root_, run_id);
}

core::errors::Result<std::filesystem::path> ArtifactWriter::persist(
    const protocol::RunLog& log, const protocol::RunResult& result) const {
    auto target_result = run_dir(log.run_id);
    if (core::errors::is_error(target_result)) {
        return core::errors::get_error(target_result);
    }
    const auto target = core::errors::get_value(target_result);

    std::error_code ec;
    if (std::filesystem::exists(target, ec) || ec) {
        return AgentError{ErrorCategory::Persistence,
                          "Artifact already exists for run: " + target.string(),
                          "artifact_exists"};
    }

    std::string event_log;
    std::string result_text;
    try {
        event_log = render_event_log(log);
        result_text = protocol::run_result_to_json(result).dump(
            2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        return AgentError{ErrorCategory::Persistence,
                          std::string("Unable to serialize artifact: ") + e.what(),
                          "artifact_serialize_failed"};
    }

    StagingDirectory staging(target.parent_path() /
                             ("." + log.run_id + "." +
                              core::config::generate_id("staging", 8)));
    std::filesystem::create_directory(staging.path(), ec);
    if (ec) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to create staging directory: " +
                              staging.path().string(),
                          "artifact_dir_create_failed"};
    }

    auto events_written = write_text(staging.path() / kEventLogFile, event_log);
    if (core::errors::is_error(events_written)) {
        return core::errors::get_error(events_written);
    }
    auto result_written = write_text(staging.path() / kResultFile, result_text);
    if (core::errors::is_error(result_written)) {
        return core::errors::get_error(result_written);
    }

    std::filesystem::rename(staging.path(), target, ec);
    if (ec) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to publish artifact " + target.string() + ": " +
                              ec.message(),
                          "artifact_publish_failed"};
    }
    staging.release();
    AGENTRUN_LOG_INFO("ArtifactWriter: published " + target.string());
    return target;
}

core::errors::Result<protocol::RunLog> load_run_log(
    const std::filesystem::path& run_dir) {
    const auto path = run_dir / kEventLogFile;
    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Input,
                          "Unable to open event log: " + path.string(),
                          "artifact_open_failed"};
    }

    std::string line;
    if (!std::getline(in, line)) {
        return AgentError{ErrorCategory::Input,
                          "Event log is empty: " + path.string(),
                          "malformed_artifact"};
    }
    const json header = json::parse(line, nullptr, false);
    if (header.is_discarded()) {
        return AgentError{ErrorCategory::Input,
                          "Event log header is not valid JSON: " + path.string(),
                          "malformed_artifact"};
    }
    auto log_result = protocol::log_header_from_json(header);
    if (core::errors::is_error(log_result)) {
        return core::errors::get_error(log_result);
    }
    protocol::RunLog log = core::errors::take_value(std::move(log_result));

    std::size_t line_number = 1;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        const json record = json::parse(line, nullptr, false);
        if (record.is_discarded()) {
            return AgentError{ErrorCategory::Input,
                              "Event log line " + std::to_string(line_number) +
                                  " is not valid JSON",
                              "malformed_artifact"};
        }
        auto entry = protocol::log_entry_from_json(record);
        if (core::errors::is_error(entry)) {
            return core::errors::get_error(entry);
        }
        log.entries.push_back(core::errors::take_value(std::move(entry)));
    }
    return log;
}

core::errors::Result<protocol::RunResult> load_result(
    const std::filesystem::path& run_dir) {
    const auto path = run_dir / kResultFile;
    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Input,
                          "Unable to open result: " + path.string(),
                          "artifact_open_failed"};
    }
    const json payload = json::parse(in, nullptr, false);
    if (payload.is_discarded()) {
        return AgentError{ErrorCategory::Input,
                          "Result is not valid JSON: " + path.string(),
                          "malformed_artifact"};
    }
    return protocol::run_result_from_json(payload);
}

}  // namespace agentrun::session
