#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <system_error>
#include <utility>

namespace warden::policy {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

bool is_dangerous_path_char(const char c) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7F) {
        return true;
    }
    return c == '<' || c == '>' || c == '|' || c == '"' || c == '\'';
}

std::string describe_char(const char c) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7F) {
        return "control character 0x" + std::string(1, "0123456789abcdef"[uc >> 4]) +
               std::string(1, "0123456789abcdef"[uc & 0x0F]);
    }
    return std::string("'") + c + "'";
}

// First component of `path` that is a symlink to nothing. Such a link is
// left unresolved by weakly_canonical, but a write through it still lands at
// its target.
std::optional<std::filesystem::path> find_dangling_link(const std::filesystem::path& path) {
    std::filesystem::path prefix;
    for (const auto& part : path) {
        prefix /= part;
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(prefix, ec);
        if (ec || !std::filesystem::exists(status)) {
            return std::nullopt;
        }
        if (std::filesystem::is_symlink(status) && !std::filesystem::exists(prefix, ec)) {
            return prefix;
        }
    }
    return std::nullopt;
}

}  // namespace

PolicyGuard::PolicyGuard(CommandPolicy command_policy, PathPolicy path_policy,
                         PatternPolicy pattern_policy, KeyPolicy key_policy)
    : command_policy_(std::move(command_policy)),
      path_policy_(std::move(path_policy)),
      pattern_policy_(pattern_policy),
      key_policy_(std::move(key_policy)) {}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    // A trailing separator on the root shows up as one empty element.
    while (root_it != root.end() && root_it->empty()) {
        ++root_it;
    }
    return root_it == root.end();
}

bool PolicyGuard::has_parent_segment(const std::string& value) {
    std::size_t start = 0;
    while (start <= value.size()) {
        std::size_t end = value.find_first_of("/\\", start);
        if (end == std::string::npos) {
            end = value.size();
        }
        if (value.compare(start, end - start, "..") == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

std::string PolicyGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::vector<std::filesystem::path> PolicyGuard::allowed_roots() const {
    if (!path_policy_.allowed_roots.empty()) {
        return path_policy_.allowed_roots;
    }

    std::vector<std::filesystem::path> roots;
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        roots.push_back(cwd);
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        home = std::getenv("USERPROFILE");
    }
    if (home != nullptr && *home != '\0') {
        roots.emplace_back(home);
    }
    roots.emplace_back("/tmp");
    roots.emplace_back("/var/tmp");
    return roots;
}

core::errors::Result<ValidatedPath> PolicyGuard::validate_path(
    const std::string& raw_path) const {
    if (raw_path.empty()) {
        return AgentError{ErrorCategory::Input, "File path cannot be empty.",
                          "empty_path"};
    }

    for (const char c : raw_path) {
        if (is_dangerous_path_char(c)) {
            return AgentError{ErrorCategory::Policy,
                              "Dangerous " + describe_char(c) + " in path: " + raw_path,
                              "dangerous_character"};
        }
    }

    if (has_parent_segment(raw_path)) {
        return AgentError{ErrorCategory::Policy,
                          "Path traversal detected: " + raw_path, "path_traversal"};
    }

    const std::filesystem::path requested(raw_path);
    if (!requested.is_absolute()) {
        return AgentError{ErrorCategory::Policy,
                          "Only absolute paths are allowed: " + raw_path,
                          "relative_path",
                          "Prefix the path with the working directory."};
    }

    if (const auto dangling = find_dangling_link(requested)) {
        return AgentError{ErrorCategory::Policy,
                          "Path goes through a dangling symbolic link: " + dangling->string(),
                          "dangling_symlink"};
    }

    std::error_code ec;
    const std::filesystem::path resolved =
        std::filesystem::weakly_canonical(requested, ec);
    if (ec) {
        return AgentError{ErrorCategory::Input,
                          "Unable to resolve path " + raw_path + ": " + ec.message(),
                          "path_resolution_failed"};
    }

    for (const auto& root : allowed_roots()) {
        std::error_code root_ec;
        const auto canonical_root = std::filesystem::weakly_canonical(root, root_ec);
        if (root_ec) {
            continue;
        }
        if (is_within_root(canonical_root, resolved)) {
            return ValidatedPath(requested.lexically_normal(), resolved);
        }
    }

    return AgentError{ErrorCategory::Policy,
                      "Path not in allowed directory: " + resolved.string(),
                      "path_outside_allowed_dirs",
                      "Allowed: working directory, home directory, /tmp, /var/tmp."};
}

core::errors::Result<ValidatedCommand> PolicyGuard::validate_command(
    const std::string& command) const {
    if (command.empty()) {
        return AgentError{ErrorCategory::Input, "Command cannot be empty.",
                          "empty_command"};
    }

    if (command.size() > command_policy_.max_length) {
        return AgentError{ErrorCategory::Policy,
                          "Command too long: " + std::to_string(command.size()) +
                              " characters (limit " +
                              std::to_string(command_policy_.max_length) + ")",
                          "command_too_long"};
    }

    const std::string lowered = lowercase(command);
    for (const auto& blocked : command_policy_.blocked_substrings) {
        const std::string blocked_lowered = lowercase(blocked);
        if (lowered.find(blocked_lowered) == std::string::npos) {
            continue;
        }
        return AgentError{ErrorCategory::Policy,
                          "Command contains blocked operation: " + blocked,
                          "blocked_command"};
    }

    const auto pipes =
        static_cast<std::size_t>(std::count(command.begin(), command.end(), '|'));
    if (pipes > command_policy_.max_pipes) {
        return AgentError{ErrorCategory::Policy,
                          "Too many pipes in command: " + command, "too_many_pipes"};
    }

    const auto redirects =
        static_cast<std::size_t>(std::count(command.begin(), command.end(), '>') +
                                 std::count(command.begin(), command.end(), '<'));
    if (redirects > command_policy_.max_redirects) {
        return AgentError{ErrorCategory::Policy,
                          "Too many redirects in command: " + command,
                          "too_many_redirects"};
    }

    return ValidatedCommand(command);
}

core::errors::Result<ValidatedPattern> PolicyGuard::validate_glob_pattern(
    const std::string& pattern) const {
    if (pattern.empty()) {
        return AgentError{ErrorCategory::Input, "Pattern cannot be empty.",
                          "empty_pattern"};
    }
    if (pattern.find('\0') != std::string::npos) {
        return AgentError{ErrorCategory::Policy, "Null character in pattern.",
                          "dangerous_character"};
    }
    if (has_parent_segment(pattern)) {
        return AgentError{ErrorCategory::Policy,
                          "Path traversal detected in pattern: " + pattern,
                          "path_traversal"};
    }

    const auto wildcards =
        static_cast<std::size_t>(std::count(pattern.begin(), pattern.end(), '*'));
    if (wildcards > pattern_policy_.max_wildcards) {
        return AgentError{ErrorCategory::Policy,
                          "Pattern too complex (" + std::to_string(wildcards) +
                              " wildcards): " + pattern,
                          "pattern_too_complex"};
    }

    return ValidatedPattern(pattern);
}

core::errors::Result<ValidatedKey> PolicyGuard::validate_api_key(
    const std::string& api_key) const {
    if (api_key.empty()) {
        return AgentError{ErrorCategory::Input, "API key cannot be empty.",
                          "empty_api_key"};
    }
    if (api_key.rfind(key_policy_.required_prefix, 0) != 0) {
        return AgentError{ErrorCategory::Input,
                          "Invalid API key format (should start with '" +
                              key_policy_.required_prefix + "')",
                          "invalid_api_key"};
    }
    if (api_key.size() < key_policy_.min_length ||
        api_key.size() > key_policy_.max_length) {
        return AgentError{ErrorCategory::Input,
                          "API key length " + std::to_string(api_key.size()) +
                              " outside " + std::to_string(key_policy_.min_length) +
                              ".." + std::to_string(key_policy_.max_length),
                          "invalid_api_key"};
    }
    return ValidatedKey(api_key);
}

core::errors::Status PolicyGuard::check_file_permissions(const ValidatedPath& path) const {
    std::error_code ec;
    const auto link_status = std::filesystem::symlink_status(path.requested(), ec);
    if (ec || !std::filesystem::exists(link_status)) {
        return std::nullopt;
    }

    if (std::filesystem::is_symlink(link_status)) {
        return AgentError{ErrorCategory::Policy,
                          "Symbolic links are not allowed: " + path.requested().string(),
                          "symlink_not_allowed"};
    }

    if (std::filesystem::is_regular_file(link_status)) {
        const auto size = std::filesystem::file_size(path.requested(), ec);
        if (ec) {
            return AgentError{ErrorCategory::Execution,
                              "Failed to get metadata for " +
                                  path.requested().string() + ": " + ec.message(),
                              "metadata_failed"};
        }
        if (size > path_policy_.max_file_bytes) {
            return AgentError{ErrorCategory::Policy,
                              "File too large: " + std::to_string(size) + " bytes (" +
                                  path.requested().string() + ")",
                              "file_too_large"};
        }
    }

    return std::nullopt;
}

}  // namespace warden::policy
