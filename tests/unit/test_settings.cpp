#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "core/config/settings.hpp"
#include "core/errors/agent_errors.hpp"
#include "temp_workspace.hpp"

namespace {

using warden::core::config::EnvLookup;
using warden::core::config::load_settings;
using warden::core::config::require_api_key;
using warden::core::config::Settings;
using warden::core::errors::ErrorCategory;
using warden::core::errors::get_error;
using warden::core::errors::get_value;
using warden::core::errors::is_error;
using warden::testing::TempWorkspace;

EnvLookup fake_env(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        const auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

TEST(SettingsTest, DefaultsWhenNothingConfigured) {
    TempWorkspace workspace("settings");
    auto result = load_settings(workspace.root() / ".warden", fake_env({}));
    ASSERT_FALSE(is_error(result));
    const auto& settings = get_value(result);

    EXPECT_TRUE(settings.api_key.empty());
    EXPECT_EQ(settings.api_base_url, "https://api.anthropic.com");
    EXPECT_EQ(settings.timeout_ms, 120000u);
    EXPECT_FALSE(settings.auto_save);
    EXPECT_EQ(settings.max_tokens, 8192u);

    auto missing = require_api_key(settings);
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->category, ErrorCategory::Input);
    EXPECT_EQ(missing->code, "missing_api_key");
    EXPECT_FALSE(missing->hint.empty());
}

TEST(SettingsTest, ReadsSettingsFile) {
    TempWorkspace workspace("settings");
    workspace.write(".warden/settings.json", R"({
        "anthropic_api_key": "file-key",
        "api_base_url": "https://proxy.internal",
        "auto_save": true,
        "model": "claude-file",
        "max_tokens": 1024,
        "max_turns": 4
    })");

    auto result = load_settings(workspace.root() / ".warden",
                                fake_env({{"ANTHROPIC_BASE_URL", "https://ignored"}}));
    ASSERT_FALSE(is_error(result)) << get_error(result).message;
    const auto& settings = get_value(result);
    EXPECT_EQ(settings.api_key, "file-key");
    EXPECT_EQ(settings.api_base_url, "https://proxy.internal");
    EXPECT_TRUE(settings.auto_save);
    EXPECT_EQ(settings.model, "claude-file");
    EXPECT_EQ(settings.max_tokens, 1024u);
    EXPECT_EQ(settings.max_turns, 4u);
    EXPECT_FALSE(require_api_key(settings).has_value());
}

TEST(SettingsTest, ApiKeyPrecedence) {
    TempWorkspace workspace("settings");
    const auto dir = workspace.root() / ".warden";
    workspace.write(".warden/settings.json", R"({"anthropic_api_key": "file-key"})");
    workspace.write(".warden/settings.local.json", R"({"anthropic_auth_token": "local-token"})");

    EXPECT_EQ(get_value(load_settings(dir, fake_env({}))).api_key, "local-token");
    EXPECT_EQ(get_value(load_settings(dir, fake_env({{"ANTHROPIC_AUTH_TOKEN", "env-token"}})))
                  .api_key,
              "env-token");
    EXPECT_EQ(get_value(load_settings(dir, fake_env({{"ANTHROPIC_AUTH_TOKEN", "env-token"},
                                                     {"ANTHROPIC_API_KEY", "env-key"}})))
                  .api_key,
              "env-key");
}

TEST(SettingsTest, BaseUrlFallsBackToEnvironment) {
    TempWorkspace workspace("settings");
    auto result = load_settings(workspace.root(),
                                fake_env({{"ANTHROPIC_BASE_URL", "http://localhost:9000"}}));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).api_base_url, "http://localhost:9000");
}

TEST(SettingsTest, TimeoutFromEnvironment) {
    TempWorkspace workspace("settings");
    auto valid = load_settings(workspace.root(), fake_env({{"API_TIMEOUT_MS", "5000"}}));
    ASSERT_FALSE(is_error(valid));
    EXPECT_EQ(get_value(valid).timeout_ms, 5000u);

    for (const std::string bad : {"soon", "0", "12ms"}) {
        auto ignored = load_settings(workspace.root(), fake_env({{"API_TIMEOUT_MS", bad}}));
        ASSERT_FALSE(is_error(ignored)) << bad;
        EXPECT_EQ(get_value(ignored).timeout_ms, 120000u) << bad;
    }
}

TEST(SettingsTest, MalformedFilesAreErrors) {
    TempWorkspace workspace("settings");
    workspace.write("broken/settings.json", "{ not json");
    auto broken = load_settings(workspace.root() / "broken", fake_env({}));
    ASSERT_TRUE(is_error(broken));
    EXPECT_EQ(get_error(broken).code, "invalid_settings");

    workspace.write("array/settings.json", "[]");
    EXPECT_EQ(get_error(load_settings(workspace.root() / "array", fake_env({}))).code,
              "invalid_settings");

    workspace.write("typed/settings.json", R"({"max_turns": "ten"})");
    EXPECT_EQ(get_error(load_settings(workspace.root() / "typed", fake_env({}))).code,
              "invalid_settings");

    workspace.write("wide/settings.json", R"({"max_turns": 4294967296})");
    auto wide = load_settings(workspace.root() / "wide", fake_env({}));
    ASSERT_TRUE(is_error(wide));
    EXPECT_EQ(get_error(wide).code, "invalid_settings");
    EXPECT_NE(get_error(wide).message.find("out of range"), std::string::npos);

    workspace.write("local/settings.local.json", "{");
    EXPECT_EQ(get_error(load_settings(workspace.root() / "local", fake_env({}))).code,
              "invalid_settings");
}

}  // namespace
