#include "cli_parser.hpp"
#include <charconv>
#include <system_error>
#include <vector>

namespace warden::app::cli {

    using namespace warden::core::errors;

    namespace {

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> prompt;
            std::optional<std::string> max_turns;
            std::optional<std::string> api_key;
            std::optional<std::string> api_url;
            std::optional<std::string> timeout;
            bool show_config = false;
            bool verbose = false;
            bool help = false;
        };

        // Exception-free integer parsing with an inclusive range check.
        Result<std::uint64_t> parse_bounded(const std::string& text, const std::string& flag,
                                            std::uint64_t min, std::uint64_t max) {
            std::uint64_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return AgentError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            if (value < min || value > max) {
                return AgentError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                  "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

    } // namespace

    std::string usage() {
        return "Usage: warden [options]\n"
               "  -p, --prompt TEXT      Run a single prompt and exit\n"
               "  -m, --max-turns N      Maximum conversation turns (1-1000, default 10)\n"
               "  -a, --api-key KEY      API key (overrides config and environment)\n"
               "  -u, --api-url URL      API base URL\n"
               "  -t, --timeout SECONDS  Per-turn timeout in seconds\n"
               "      --show-config      Print the settings directory and exit\n"
               "      --verbose          Enable debug logging\n"
               "  -h, --help             Show this help\n";
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        auto read_value = [&args](size_t& i, std::optional<std::string>& slot) -> Status {
            if (i + 1 >= args.size()) {
                return AgentError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            }
            slot = args[++i];
            return std::nullopt;
        };

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            Status status;
            if (arg == "--prompt" || arg == "-p") {
                status = read_value(i, raw.prompt);
            } else if (arg == "--max-turns" || arg == "-m") {
                status = read_value(i, raw.max_turns);
            } else if (arg == "--api-key" || arg == "-a") {
                status = read_value(i, raw.api_key);
            } else if (arg == "--api-url" || arg == "-u") {
                status = read_value(i, raw.api_url);
            } else if (arg == "--timeout" || arg == "-t") {
                status = read_value(i, raw.timeout);
            } else if (arg == "--show-config") {
                raw.show_config = true;
            } else if (arg == "--verbose") {
                raw.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                raw.help = true;
            } else {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument", "Run warden --help for usage."};
            }
            if (status.has_value()) {
                return *status;
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliOptions options;
        options.show_config = raw.show_config;
        options.verbose = raw.verbose;
        options.help = raw.help;

        if (raw.prompt) {
            if (raw.prompt->empty()) {
                return AgentError{ErrorCategory::Input, "--prompt cannot be empty", "empty_prompt"};
            }
            options.prompt = raw.prompt;
        }

        if (raw.max_turns) {
            auto turns = parse_bounded(*raw.max_turns, "--max-turns", 1, 1000);
            if (is_error(turns)) {
                return get_error(turns);
            }
            options.max_turns = static_cast<std::uint32_t>(get_value(turns));
        }

        if (raw.timeout) {
            auto seconds = parse_bounded(*raw.timeout, "--timeout", 1, 86400);
            if (is_error(seconds)) {
                return get_error(seconds);
            }
            options.timeout_seconds = get_value(seconds);
        }

        if (raw.api_key) {
            if (raw.api_key->empty()) {
                return AgentError{ErrorCategory::Input, "--api-key cannot be empty", "empty_api_key"};
            }
            options.api_key = raw.api_key;
        }

        if (raw.api_url) {
            const std::string& url = *raw.api_url;
            if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
                return AgentError{ErrorCategory::Input, "Invalid --api-url: " + url, "invalid_url", "The URL must start with http:// or https://."};
            }
            options.api_url = raw.api_url;
        }

        return options;
    }

    void apply_overrides(const CliOptions& options, warden::core::config::Settings& settings) {
        if (options.api_key) settings.api_key = *options.api_key;
        if (options.api_url) settings.api_base_url = *options.api_url;
        if (options.timeout_seconds) settings.timeout_ms = *options.timeout_seconds * 1000;
        if (options.max_turns) settings.max_turns = *options.max_turns;
    }

} // namespace warden::app::cli
