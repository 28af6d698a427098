#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "core/config/settings.hpp"
#include "core/errors/agent_errors.hpp"

namespace warden::app::cli {

    struct CliOptions {
        std::optional<std::string> prompt;
        std::optional<std::uint32_t> max_turns;
        std::optional<std::string> api_key;
        std::optional<std::string> api_url;
        std::optional<std::uint64_t> timeout_seconds;
        bool show_config = false;
        bool verbose = false;
        bool help = false;
    };

    warden::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    // Command-line values win over every other source.
    void apply_overrides(const CliOptions& options, warden::core::config::Settings& settings);

    std::string usage();
}
