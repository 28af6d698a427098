#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace warden::policy {

// Substring deny-list plus shape limits. This is a heuristic, not a shell
// parser: quoting, variable expansion and command substitution can still
// smuggle anything the list does not spell out.
struct CommandPolicy {
    std::vector<std::string> blocked_substrings = {
        "rm -rf /",
        "sudo rm",
        "format",
        "del /f",
        "shutdown",
        "reboot",
        "halt",
        "poweroff",
        "mkfs",
        "fdisk",
        "dd if=",
        ":(){ :|:& };:"};
    std::size_t max_length = 1000;
    std::size_t max_pipes = 2;
    std::size_t max_redirects = 2;
};

struct PathPolicy {
    // Empty means the default allow-list: current working directory, $HOME,
    // /tmp and /var/tmp.
    std::vector<std::filesystem::path> allowed_roots;
    std::uintmax_t max_file_bytes = 100ULL * 1024 * 1024;
};

struct PatternPolicy {
    std::size_t max_wildcards = 10;
};

struct KeyPolicy {
    std::string required_prefix = "sk-ant-";
    std::size_t min_length = 30;
    std::size_t max_length = 100;
};

class PolicyGuard;

// The wrappers below can only be produced by PolicyGuard. Executor entry
// points take them instead of raw strings.

class ValidatedPath {
public:
    // Absolute path exactly as requested (symlinks not resolved).
    const std::filesystem::path& requested() const { return requested_; }
    // Canonical form that passed the allow-list check.
    const std::filesystem::path& resolved() const { return resolved_; }

private:
    friend class PolicyGuard;
    ValidatedPath(std::filesystem::path requested, std::filesystem::path resolved)
        : requested_(std::move(requested)), resolved_(std::move(resolved)) {}

    std::filesystem::path requested_;
    std::filesystem::path resolved_;
};

class ValidatedCommand {
public:
    const std::string& text() const { return text_; }

private:
    friend class PolicyGuard;
    explicit ValidatedCommand(std::string text) : text_(std::move(text)) {}

    std::string text_;
};

class ValidatedPattern {
public:
    const std::string& text() const { return text_; }
    bool is_absolute() const { return !text_.empty() && text_.front() == '/'; }

private:
    friend class PolicyGuard;
    explicit ValidatedPattern(std::string text) : text_(std::move(text)) {}

    std::string text_;
};

class ValidatedKey {
public:
    const std::string& value() const { return value_; }

private:
    friend class PolicyGuard;
    explicit ValidatedKey(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

class PolicyGuard {
public:
    explicit PolicyGuard(CommandPolicy command_policy = {},
                         PathPolicy path_policy = {},
                         PatternPolicy pattern_policy = {},
                         KeyPolicy key_policy = {});

    core::errors::Result<ValidatedPath> validate_path(const std::string& raw_path) const;

    core::errors::Result<ValidatedCommand> validate_command(
        const std::string& command) const;

    core::errors::Result<ValidatedPattern> validate_glob_pattern(
        const std::string& pattern) const;

    core::errors::Result<ValidatedKey> validate_api_key(const std::string& api_key) const;

    // Rejects symlinks and oversized regular files. A missing file passes.
    core::errors::Status check_file_permissions(const ValidatedPath& path) const;

    std::vector<std::filesystem::path> allowed_roots() const;

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static bool has_parent_segment(const std::string& value);
    static std::string lowercase(std::string value);

    CommandPolicy command_policy_;
    PathPolicy path_policy_;
    PatternPolicy pattern_policy_;
    KeyPolicy key_policy_;
};

}  // namespace warden::policy
