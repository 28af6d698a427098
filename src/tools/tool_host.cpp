#include "tools/tool_host.hpp"

#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/text/utf8.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/glob_expander.hpp"

namespace warden::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::chrono::milliseconds kBackgroundGrace{200};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    bool output_truncated = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(const int fd, bool& is_open, std::string& out, const std::size_t limit,
                bool& truncated) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const auto got = static_cast<std::size_t>(n);
            const std::size_t room = out.size() < limit ? limit - out.size() : 0;
            out.append(buffer, got < room ? got : room);
            if (got > room) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

core::errors::Result<ProcessCapture> run_shell_command(
    const std::string& command, const std::uint32_t timeout_ms,
    const std::size_t output_limit,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    if (cancel_token && cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        return capture;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0) {
        return AgentError{ErrorCategory::Internal,
                          "Failed to create process pipes for: " + command,
                          "pipe_creation_failed"};
    }
    if (pipe(stderr_pipe) != 0) {
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        return AgentError{ErrorCategory::Internal,
                          "Failed to create process pipes for: " + command,
                          "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const int fork_errno = errno;
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        return AgentError{ErrorCategory::Internal,
                          "Failed to spawn shell for: " + command + " (" +
                              std::generic_category().message(fork_errno) + ")",
                          "fork_failed"};
    }

    if (pid == 0) {
        // Own process group so a timeout can kill the whole pipeline.
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool group_killed = false;
    std::chrono::steady_clock::time_point exited_at;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        // kill(-pid) reaches the whole group, so it also works after the
        // shell itself is gone.
        if (cancel_token && cancel_token->load() && !capture.cancelled) {
            capture.cancelled = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        if (!capture.timed_out && timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(timeout_ms)) {
            capture.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            usleep(10000);
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text, output_limit,
                   capture.output_truncated);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text, output_limit,
                   capture.output_truncated);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                exited_at = std::chrono::steady_clock::now();
            }
        } else if ((stdout_open || stderr_open) && !group_killed &&
                   std::chrono::steady_clock::now() - exited_at > kBackgroundGrace) {
            // The shell is done but something it backgrounded still holds
            // the pipes. Its output so far is kept; the stragglers are not
            // waited for.
            group_killed = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

AgentError missing_field(const std::string& tool, const std::string& field) {
    return AgentError{ErrorCategory::Input,
                      "Missing field '" + field + "' for " + tool, "missing_field",
                      "Expected a string value for '" + field + "'."};
}

core::errors::Result<std::string> required_string(const json& input,
                                                  const std::string& tool,
                                                  const std::string& field) {
    if (!input.is_object() || !input.contains(field) || !input[field].is_string()) {
        return missing_field(tool, field);
    }
    return input[field].get<std::string>();
}

std::uint32_t effective_timeout_ms(const std::uint32_t configured,
                                   const ExecutionContext& context) {
    if (!context.deadline.has_value()) {
        return configured;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                               context.deadline.value() - std::chrono::steady_clock::now())
                               .count();
    if (remaining <= 0) {
        return 1;
    }
    if (configured == 0 || remaining < static_cast<std::int64_t>(configured)) {
        return static_cast<std::uint32_t>(remaining);
    }
    return configured;
}

}  // namespace

ToolHost::ToolHost(policy::PolicyGuard policy_guard, FileIo file_io, ExecutorConfig config)
    : policy_guard_(std::move(policy_guard)),
      file_io_(std::move(file_io)),
      config_(config) {}

core::errors::Result<std::string> ToolHost::execute(const std::string& name,
                                                    const json& input,
                                                    const ExecutionContext& context) const {
    WARDEN_LOG_INFO("Tool: " + name);
    if (name == protocol::kReadFileTool) {
        return dispatch_read(input);
    }
    if (name == protocol::kWriteFileTool) {
        return dispatch_write(input);
    }
    if (name == protocol::kExecuteCommandTool) {
        return dispatch_command(input, context);
    }
    if (name == protocol::kListFilesTool) {
        return dispatch_list(input);
    }
    return AgentError{ErrorCategory::Execution, "Unknown tool: " + name, "unknown_tool",
                      "Available tools: read_file, write_file, execute_command, list_files."};
}

core::errors::Result<std::string> ToolHost::dispatch_read(const json& input) const {
    auto file_path = required_string(input, protocol::kReadFileTool, "file_path");
    if (core::errors::is_error(file_path)) {
        return core::errors::get_error(file_path);
    }

    auto validated = policy_guard_.validate_path(core::errors::get_value(file_path));
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }
    return read_file(core::errors::get_value(validated));
}

core::errors::Result<std::string> ToolHost::dispatch_write(const json& input) const {
    auto file_path = required_string(input, protocol::kWriteFileTool, "file_path");
    if (core::errors::is_error(file_path)) {
        return core::errors::get_error(file_path);
    }
    auto content = required_string(input, protocol::kWriteFileTool, "content");
    if (core::errors::is_error(content)) {
        return core::errors::get_error(content);
    }

    auto validated = policy_guard_.validate_path(core::errors::get_value(file_path));
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }
    return write_file(core::errors::get_value(validated), core::errors::get_value(content));
}

core::errors::Result<std::string> ToolHost::dispatch_command(
    const json& input, const ExecutionContext& context) const {
    auto command = required_string(input, protocol::kExecuteCommandTool, "command");
    if (core::errors::is_error(command)) {
        return core::errors::get_error(command);
    }

    auto validated = policy_guard_.validate_command(core::errors::get_value(command));
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }
    return execute_command(core::errors::get_value(validated), context);
}

core::errors::Result<std::string> ToolHost::dispatch_list(const json& input) const {
    auto pattern = required_string(input, protocol::kListFilesTool, "pattern");
    if (core::errors::is_error(pattern)) {
        return core::errors::get_error(pattern);
    }

    std::string base_path;
    if (input.contains("path") && !input["path"].is_null()) {
        if (!input["path"].is_string()) {
            return missing_field(protocol::kListFilesTool, "path");
        }
        base_path = input["path"].get<std::string>();
    } else {
        std::error_code ec;
        base_path = std::filesystem::current_path(ec).string();
        if (ec) {
            return AgentError{ErrorCategory::Internal,
                              "Failed to get current directory: " + ec.message(),
                              "cwd_unavailable"};
        }
    }

    auto validated_pattern =
        policy_guard_.validate_glob_pattern(core::errors::get_value(pattern));
    if (core::errors::is_error(validated_pattern)) {
        return core::errors::get_error(validated_pattern);
    }
    auto validated_base = policy_guard_.validate_path(base_path);
    if (core::errors::is_error(validated_base)) {
        return core::errors::get_error(validated_base);
    }
    return list_files(core::errors::get_value(validated_pattern),
                      core::errors::get_value(validated_base));
}

core::errors::Result<std::string> ToolHost::read_file(const policy::ValidatedPath& path) const {
    auto permission = policy_guard_.check_file_permissions(path);
    if (permission.has_value()) {
        return *permission;
    }

    std::error_code ec;
    const auto canonical = std::filesystem::canonical(path.resolved(), ec);
    if (ec) {
        return AgentError{ErrorCategory::Execution,
                          "Failed to read file " + path.requested().string() + ": " +
                              ec.message(),
                          "file_not_found"};
    }

    auto content = file_io_.read(canonical);
    if (core::errors::is_error(content)) {
        return core::errors::get_error(content);
    }

    const auto& text = core::errors::get_value(content);
    if (text.size() > config_.max_read_bytes) {
        return AgentError{ErrorCategory::Policy,
                          "File content too large: " + std::to_string(text.size()) +
                              " bytes (" + canonical.string() + ")",
                          "content_too_large"};
    }
    if (text.size() > file_io_.config().small_file_threshold) {
        WARDEN_LOG_INFO("Processing large file: " + std::to_string(text.size()) +
                        " bytes (" + canonical.string() + ")");
    }
    return content;
}

core::errors::Result<std::string> ToolHost::write_file(const policy::ValidatedPath& path,
                                                       const std::string& content) const {
    if (content.size() > config_.max_write_bytes) {
        return AgentError{ErrorCategory::Policy,
                          "Content too large: " + std::to_string(content.size()) +
                              " bytes (" + path.requested().string() + ")",
                          "content_too_large"};
    }

    auto permission = policy_guard_.check_file_permissions(path);
    if (permission.has_value()) {
        return *permission;
    }

    const auto& target = path.resolved();
    const auto parent = target.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return AgentError{ErrorCategory::Execution,
                              "Failed to create directory " + parent.string() + ": " +
                                  ec.message(),
                              "create_directory_failed"};
        }
    }

    auto written = file_io_.write(target, content);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return "Successfully wrote " + std::to_string(core::errors::get_value(written)) +
           " bytes to file: " + target.string();
}

core::errors::Result<std::string> ToolHost::execute_command(
    const policy::ValidatedCommand& command, const ExecutionContext& context) const {
    WARDEN_LOG_INFO("Executing: " + command.text());
    const std::uint32_t timeout_ms = effective_timeout_ms(config_.command_timeout_ms, context);

    auto capture_result = run_shell_command(command.text(), timeout_ms,
                                            config_.max_read_bytes, context.cancel_token);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);

    if (capture.cancelled) {
        return AgentError{ErrorCategory::Execution,
                          "Command cancelled: " + command.text(), "command_cancelled"};
    }
    if (capture.timed_out) {
        return AgentError{ErrorCategory::Execution,
                          "Command timed out after " + std::to_string(timeout_ms) +
                              " ms: " + command.text(),
                          "command_timeout"};
    }
    if (capture.exit_code != 0) {
        WARDEN_LOG_WARN("Command failed with exit code " + std::to_string(capture.exit_code) +
                        ": " + command.text());
    }
    if (capture.output_truncated) {
        WARDEN_LOG_WARN("Command output truncated at " +
                        std::to_string(config_.max_read_bytes) + " bytes: " + command.text());
    }

    std::string result = core::text::sanitize_utf8(capture.stdout_text);
    if (!capture.stderr_text.empty()) {
        if (!result.empty()) {
            result += "\n";
        }
        result += core::text::sanitize_utf8(capture.stderr_text);
    }
    if (result.empty()) {
        result = "(command produced no output)";
    }
    return result;
}

core::errors::Result<std::string> ToolHost::list_files(
    const policy::ValidatedPattern& pattern, const policy::ValidatedPath& base) const {
    const std::string full_pattern =
        pattern.is_absolute() ? pattern.text()
                              : (base.resolved() / pattern.text()).string();

    // The directory the expansion starts from must itself pass the
    // allow-list; an absolute pattern never went through the base check.
    auto start = policy_guard_.validate_path(literal_prefix(full_pattern));
    if (core::errors::is_error(start)) {
        return core::errors::get_error(start);
    }

    const auto expansion = expand_glob(full_pattern, config_.max_listed_files);
    if (expansion.truncated) {
        WARDEN_LOG_WARN("Too many files found for " + full_pattern + ", limiting to " +
                        std::to_string(config_.max_listed_files));
    }
    if (expansion.paths.empty()) {
        return std::string("(no files found)");
    }

    std::ostringstream out;
    for (std::size_t i = 0; i < expansion.paths.size(); ++i) {
        if (i > 0) {
            out << "\n";
        }
        out << expansion.paths[i];
    }
    return out.str();
}

}  // namespace warden::tools
