#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include "app/cli_parser.hpp"
#include "core/config/correlation_id.hpp"
#include "core/config/settings.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "provider/api_client.hpp"
#include "provider/http_transport.hpp"
#include "provider/performance_stats.hpp"
#include "session/artifact_writer.hpp"
#include "session/orchestrator.hpp"
#include "tools/tool_host.hpp"

namespace {

void report_input_error(const warden::core::errors::AgentError& err) {
    WARDEN_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        WARDEN_LOG_INFO("Hint: " + err.hint);
    }
}

void log_stats(const warden::provider::StatsSnapshot& stats) {
    WARDEN_LOG_INFO("API stats: total=" + std::to_string(stats.total_requests) +
                    " success=" + std::to_string(stats.successful_requests) +
                    " failed=" + std::to_string(stats.failed_requests) +
                    " attempts=" + std::to_string(stats.attempts) +
                    " retries=" + std::to_string(stats.retries) +
                    " avg_ms=" + std::to_string(stats.average_duration_ms()) +
                    " success_rate=" + std::to_string(stats.success_rate()) + "%");
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Generate the correlation id for this run
    const std::string correlation_id = warden::core::config::generate_correlation_id();
    warden::core::logging::Logger::get().set_correlation_id(correlation_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = warden::app::cli::parse_and_validate(argc, argv);
    if (warden::core::errors::is_error(parsed)) {
        report_input_error(warden::core::errors::get_error(parsed));
        return 2;
    }
    const auto& options = warden::core::errors::get_value(parsed);

    if (options.help) {
        std::cout << warden::app::cli::usage();
        return 0;
    }
    if (options.verbose) {
        warden::core::logging::Logger::get().set_min_level(
            warden::core::logging::LogLevel::DEBUG);
    }

    const auto settings_dir = warden::core::config::default_settings_dir();
    if (options.show_config) {
        std::cout << "Settings directory: " << settings_dir.string() << "\n"
                  << "  settings.json        " << (settings_dir / "settings.json").string() << "\n"
                  << "  settings.local.json  " << (settings_dir / "settings.local.json").string()
                  << "\n";
        return 0;
    }

    // 3. Resolve configuration: files, environment, then flags
    auto loaded = warden::core::config::load_settings(settings_dir);
    if (warden::core::errors::is_error(loaded)) {
        report_input_error(warden::core::errors::get_error(loaded));
        return 2;
    }
    auto settings = warden::core::errors::get_value(loaded);
    warden::app::cli::apply_overrides(options, settings);

    auto key_present = warden::core::config::require_api_key(settings);
    if (key_present.has_value()) {
        report_input_error(*key_present);
        return 2;
    }

    warden::policy::PolicyGuard policy_guard;
    auto validated_key = policy_guard.validate_api_key(settings.api_key);
    if (warden::core::errors::is_error(validated_key)) {
        report_input_error(warden::core::errors::get_error(validated_key));
        return 2;
    }

    // 4. Wire the engine
    warden::provider::ClientConfig client_config;
    client_config.api_base_url = settings.api_base_url;
    client_config.timeout_ms = settings.timeout_ms;
    client_config.correlation_id = correlation_id;
    client_config.request.model = settings.model;
    client_config.request.max_tokens = settings.max_tokens;

    auto stats = std::make_shared<warden::provider::PerformanceStats>();
    auto client = std::make_shared<warden::provider::ResilientApiClient>(
        warden::core::errors::get_value(validated_key), client_config,
        std::make_shared<warden::provider::CurlHttpTransport>(), stats);
    auto tool_host = std::make_shared<warden::tools::ToolHost>(policy_guard);

    warden::session::OrchestratorConfig orchestrator_config;
    orchestrator_config.max_turns = settings.max_turns;
    orchestrator_config.turn_timeout = std::chrono::milliseconds(settings.timeout_ms);
    orchestrator_config.model = settings.model;
    orchestrator_config.correlation_id = correlation_id;

    warden::session::OutputSink sink;
    sink.on_text = [](const std::string& text) { std::cout << "\nAssistant:\n" << text << "\n"; };
    sink.on_tool = [](const std::string& name) { std::cout << "\nTool: " << name << "\n"; };

    warden::session::Orchestrator orchestrator(client, tool_host, orchestrator_config, sink);

    std::error_code cwd_ec;
    const auto workspace_root = std::filesystem::current_path(cwd_ec);
    if (cwd_ec) {
        WARDEN_LOG_ERROR("Failed to get current directory: " + cwd_ec.message());
        return 1;
    }
    warden::session::ArtifactWriter artifact_writer(workspace_root);
    if (settings.auto_save) {
        orchestrator.set_turn_observer(
            [&artifact_writer, &correlation_id](const warden::session::TurnRecord& record) {
                auto written = artifact_writer.write_turn_event(correlation_id, record);
                if (warden::core::errors::is_error(written)) {
                    const auto& err = warden::core::errors::get_error(written);
                    WARDEN_LOG_ERROR("Failed to write turn event [" + err.code + "]: " +
                                     err.message);
                }
            });
    }

    // 5. Run
    WARDEN_LOG_INFO("Model: " + settings.model + ", endpoint: " + settings.api_base_url);
    warden::core::errors::Status outcome;
    if (options.prompt.has_value()) {
        outcome = orchestrator.run_one_shot(*options.prompt);
    } else {
        outcome = orchestrator.run_interactive([]() -> std::optional<std::string> {
            std::cout << "\nYou: " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line)) {
                return std::nullopt;
            }
            return line;
        });
    }

    if (settings.auto_save) {
        auto saved = artifact_writer.write_transcript(correlation_id, orchestrator.transcript());
        if (warden::core::errors::is_error(saved)) {
            const auto& err = warden::core::errors::get_error(saved);
            WARDEN_LOG_ERROR("Failed to save transcript [" + err.code + "]: " + err.message);
        } else {
            WARDEN_LOG_INFO("Transcript: " + warden::core::errors::get_value(saved).string());
        }
    }
    log_stats(stats->snapshot());

    if (outcome.has_value()) {
        WARDEN_LOG_ERROR("Run failed: " + warden::core::errors::describe(*outcome));
        return 1;
    }
    return 0;
}
