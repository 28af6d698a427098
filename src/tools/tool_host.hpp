#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "policy/policy_guard.hpp"
#include "tools/file_io.hpp"

namespace warden::tools {

struct ExecutorConfig {
    std::uint32_t command_timeout_ms = 120000;
    std::size_t max_read_bytes = 10 * 1024 * 1024;
    std::size_t max_write_bytes = 50 * 1024 * 1024;
    std::size_t max_listed_files = 1000;
};

// Per-call limits imposed by the caller (the orchestrator's turn deadline).
struct ExecutionContext {
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

class ToolHost {
public:
    explicit ToolHost(policy::PolicyGuard policy_guard = policy::PolicyGuard(),
                      FileIo file_io = FileIo(), ExecutorConfig config = {});

    // Dispatches on the tool name and validates the input shape of the
    // manifest. Nothing touches the filesystem or spawns a process until
    // every check has passed.
    core::errors::Result<std::string> execute(const std::string& name,
                                              const nlohmann::json& input,
                                              const ExecutionContext& context = {}) const;

    core::errors::Result<std::string> read_file(const policy::ValidatedPath& path) const;

    core::errors::Result<std::string> write_file(const policy::ValidatedPath& path,
                                                 const std::string& content) const;

    // A non-zero exit status is logged and the output is still returned.
    core::errors::Result<std::string> execute_command(
        const policy::ValidatedCommand& command,
        const ExecutionContext& context = {}) const;

    core::errors::Result<std::string> list_files(const policy::ValidatedPattern& pattern,
                                                 const policy::ValidatedPath& base) const;

    const policy::PolicyGuard& policy_guard() const { return policy_guard_; }

private:
    core::errors::Result<std::string> dispatch_read(const nlohmann::json& input) const;
    core::errors::Result<std::string> dispatch_write(const nlohmann::json& input) const;
    core::errors::Result<std::string> dispatch_command(const nlohmann::json& input,
                                                       const ExecutionContext& context) const;
    core::errors::Result<std::string> dispatch_list(const nlohmann::json& input) const;

    policy::PolicyGuard policy_guard_;
    FileIo file_io_;
    ExecutorConfig config_;
};

}  // namespace warden::tools
