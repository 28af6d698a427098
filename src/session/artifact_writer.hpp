#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "session/orchestrator.hpp"

namespace warden::session {

// Persists a run under <workspace>/.warden/sessions/: the transcript as
// <id>.json and one line per finished turn in <id>.jsonl.
class ArtifactWriter {
public:
    explicit ArtifactWriter(std::filesystem::path workspace_root,
                            std::filesystem::path session_subdir = ".warden/sessions");

    // Overwrites any earlier transcript for the same id.
    core::errors::Result<std::filesystem::path> write_transcript(
        const std::string& correlation_id, const nlohmann::json& transcript) const;

    core::errors::Result<std::filesystem::path> write_turn_event(
        const std::string& correlation_id, const TurnRecord& record) const;

    core::errors::Result<std::filesystem::path> session_path(
        const std::string& correlation_id, const std::string& extension) const;

private:
    std::filesystem::path workspace_root_;
    std::filesystem::path session_subdir_;
};

}  // namespace warden::session
