#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace warden::core::config {

struct Settings {
    std::string api_key;
    std::string api_base_url = "https://api.anthropic.com";
    std::uint64_t timeout_ms = 120000;
    bool auto_save = false;
    std::string model = "claude-3-haiku-20240307";
    std::uint32_t max_tokens = 8192;
    std::uint32_t max_turns = 10;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Reads the real process environment; empty values count as unset.
std::optional<std::string> process_env(const std::string& name);

// <cwd>/.warden
std::filesystem::path default_settings_dir();

// Defaults, then settings.json, then settings.local.json, then the
// environment. Missing files are skipped; malformed ones are an error.
errors::Result<Settings> load_settings(const std::filesystem::path& settings_dir,
                                       const EnvLookup& env = process_env);

// Error naming where a key can be configured when none was found.
errors::Status require_api_key(const Settings& settings);

}  // namespace warden::core::config
