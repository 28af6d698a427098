#include "session/artifact_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>

namespace warden::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

bool is_safe_id(const std::string& id) {
    for (const char c : id) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}

}  // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path workspace_root,
                               std::filesystem::path session_subdir)
    : workspace_root_(std::move(workspace_root)),
      session_subdir_(std::move(session_subdir)) {}

core::errors::Result<std::filesystem::path> ArtifactWriter::session_path(
    const std::string& correlation_id, const std::string& extension) const {
    if (correlation_id.empty()) {
        return AgentError{ErrorCategory::Input, "Correlation ID cannot be empty.",
                          "invalid_correlation_id"};
    }
    if (!is_safe_id(correlation_id)) {
        return AgentError{ErrorCategory::Input,
                          "Correlation ID contains unsupported characters: " + correlation_id,
                          "invalid_correlation_id"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return AgentError{ErrorCategory::Input,
                          "Workspace root is not a directory: " + workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const auto canonical_root = std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Input,
                          "Unable to resolve workspace root: " + workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const auto sessions_dir = canonical_root / session_subdir_;
    std::filesystem::create_directories(sessions_dir, ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to create sessions directory: " + sessions_dir.string(),
                          "session_dir_create_failed"};
    }
    return sessions_dir / (correlation_id + extension);
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_transcript(
    const std::string& correlation_id, const json& transcript) const {
    auto path_result = session_path(correlation_id, ".json");
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to open transcript file: " + path.string(),
                          "session_open_failed"};
    }
    out << transcript.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to write transcript: " + path.string(),
                          "session_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_turn_event(
    const std::string& correlation_id, const TurnRecord& record) const {
    auto path_result = session_path(correlation_id, ".jsonl");
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "turn";
    event["correlation_id"] = correlation_id;
    event["turn"] = record.turn;
    event["status"] = record.success ? "completed" : "failed";
    event["error_message"] = record.error_message;
    event["tool_calls"] = record.tool_calls;

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to open session log: " + path.string(),
                          "session_open_failed"};
    }
    out << event.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to write turn event: " + path.string(),
                          "session_write_failed"};
    }
    return path;
}

}  // namespace warden::session
