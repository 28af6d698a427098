#include "core/config/settings.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <type_traits>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace warden::core::config {

using errors::AgentError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr const char* kSettingsFile = "settings.json";
constexpr const char* kLocalSettingsFile = "settings.local.json";

AgentError settings_error(const std::filesystem::path& path, const std::string& what) {
    return AgentError{ErrorCategory::Input,
                      "Failed to parse settings file " + path.string() + ": " + what,
                      "invalid_settings"};
}

// Missing file -> empty object.
errors::Result<json> read_json_object(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return json::object();
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Input, "Failed to read settings file " + path.string(),
                          "settings_read_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    json parsed = json::parse(buffer.str(), nullptr, false);
    if (parsed.is_discarded()) {
        return settings_error(path, "not valid JSON");
    }
    if (!parsed.is_object()) {
        return settings_error(path, "top level must be an object");
    }
    return parsed;
}

// Copies `key` into `target` when present. A present key of the wrong type
// is an error.
template <typename T>
errors::Status read_field(const json& object, const char* key,
                          const std::filesystem::path& path, T& target) {
    if (!object.contains(key) || object[key].is_null()) {
        return std::nullopt;
    }
    const json& value = object[key];
    if constexpr (std::is_same_v<T, std::string>) {
        if (!value.is_string()) {
            return settings_error(path, std::string("'") + key + "' must be a string");
        }
        target = value.get<std::string>();
    } else if constexpr (std::is_same_v<T, bool>) {
        if (!value.is_boolean()) {
            return settings_error(path, std::string("'") + key + "' must be a boolean");
        }
        target = value.get<bool>();
    } else {
        if (!value.is_number_unsigned() || value.get<std::uint64_t>() == 0) {
            return settings_error(path, std::string("'") + key + "' must be a positive integer");
        }
        if (value.get<std::uint64_t>() > std::numeric_limits<T>::max()) {
            return settings_error(path, std::string("'") + key + "' is out of range");
        }
        target = value.get<T>();
    }
    return std::nullopt;
}

std::optional<std::uint64_t> parse_u64(const std::string& text) {
    std::uint64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value == 0) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::filesystem::path default_settings_dir() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        cwd = ".";
    }
    return cwd / ".warden";
}

errors::Result<Settings> load_settings(const std::filesystem::path& settings_dir,
                                       const EnvLookup& env) {
    Settings settings;

    const auto settings_path = settings_dir / kSettingsFile;
    auto user = read_json_object(settings_path);
    if (errors::is_error(user)) {
        return errors::get_error(user);
    }
    const json& user_json = errors::get_value(user);

    std::string file_api_key;
    std::string file_base_url;
    for (auto status : {read_field(user_json, "anthropic_api_key", settings_path, file_api_key),
                        read_field(user_json, "api_base_url", settings_path, file_base_url),
                        read_field(user_json, "auto_save", settings_path, settings.auto_save),
                        read_field(user_json, "model", settings_path, settings.model),
                        read_field(user_json, "max_tokens", settings_path, settings.max_tokens),
                        read_field(user_json, "max_turns", settings_path, settings.max_turns)}) {
        if (status.has_value()) {
            return *status;
        }
    }

    const auto local_path = settings_dir / kLocalSettingsFile;
    auto local = read_json_object(local_path);
    if (errors::is_error(local)) {
        return errors::get_error(local);
    }
    std::string local_token;
    auto token_status =
        read_field(errors::get_value(local), "anthropic_auth_token", local_path, local_token);
    if (token_status.has_value()) {
        return *token_status;
    }

    // Key precedence: ANTHROPIC_API_KEY, ANTHROPIC_AUTH_TOKEN, local token,
    // settings key.
    if (auto key = env("ANTHROPIC_API_KEY")) {
        settings.api_key = *key;
    } else if (auto token = env("ANTHROPIC_AUTH_TOKEN")) {
        settings.api_key = *token;
    } else if (!local_token.empty()) {
        settings.api_key = local_token;
    } else {
        settings.api_key = file_api_key;
    }

    if (!file_base_url.empty()) {
        settings.api_base_url = file_base_url;
    } else if (auto base_url = env("ANTHROPIC_BASE_URL")) {
        settings.api_base_url = *base_url;
    }

    if (auto timeout = env("API_TIMEOUT_MS")) {
        const auto parsed = parse_u64(*timeout);
        if (parsed.has_value()) {
            settings.timeout_ms = *parsed;
        } else {
            WARDEN_LOG_WARN("Ignoring invalid API_TIMEOUT_MS: " + *timeout);
        }
    }

    return settings;
}

errors::Status require_api_key(const Settings& settings) {
    if (!settings.api_key.empty()) {
        return std::nullopt;
    }
    return AgentError{ErrorCategory::Input, "API key not found.", "missing_api_key",
                      "Set ANTHROPIC_API_KEY or add anthropic_api_key to .warden/settings.json."};
}

}  // namespace warden::core::config
