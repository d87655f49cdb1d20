/**
 * @file main.cpp
 * @brief capslock CLI entry point
 *
 * Commands:
 *   analyze      - Infer per-unit capabilities for a dependency closure
 *   check-rules  - Load and validate a capability rule table
 *   version      - Show version information
 */

#include "capslock/canonical_json.hpp"
#include "capslock/common.hpp"
#include "capslock/config.hpp"
#include "capslock/engine.hpp"
#include "capslock/loader.hpp"
#include "capslock/logging.hpp"
#include "capslock/report.hpp"
#include "capslock/rules.hpp"
#include "capslock/version.hpp"

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>

namespace {

void print_version()
{
    fmt::print("capslock {} ({})\n", capslock::kVersion, capslock::kBuildId);
    fmt::print("  ir:     {}\n", capslock::kIrSchemaVersion);
    fmt::print("  rules:  {}\n", capslock::kRulesSchemaVersion);
    fmt::print("  report: {}\n", capslock::kReportSchemaVersion);
    fmt::print("  llvm frontend: {}\n", capslock::loader::llvm_frontend_available() ? "yes" : "no");
}

void print_help()
{
    fmt::print(R"(capslock - static capability analysis for compiled dependency closures

Usage: capslock <command> [options]

Commands:
  analyze       Infer per-unit capabilities and evidence paths
  check-rules   Validate a capability rule table
  version       Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'capslock <command> --help' for command-specific options.
)");
}

void print_analyze_help()
{
    fmt::print(R"(Usage: capslock analyze [options]

Infer per-unit capabilities for a whole dependency closure

Options:
  --ir FILE                 IR artifact (cir.v1 JSON, .bc or .ll); repeatable (required)
  --rules FILE              Capability rule table (.json or .cm) (required)
  --output FILE, -o         Report file (default: stdout)
  --jobs N, -j N            Number of worker threads (0 = auto, default: 1)
  --schema-dir DIR          Path to schema directory (default: ./schemas when present)
  --config FILE             caps_config.v1 configuration file
  --indirect-policy POLICY  signature | address_taken
  --max-time-ms N           Abort with no report after N milliseconds
  --strict                  Fail on unsupported IR constructs
  --edges                   Include the call edge list in the report
  --log-level LEVEL         Log filter, e.g. debug or graph=trace,rules=debug
  --log-file FILE           Also write logs to FILE
  --help, -h                Show this help

Output:
  caps_report.v1 canonical JSON
)");
}

void print_check_rules_help()
{
    fmt::print(R"(Usage: capslock check-rules [options]

Load a capability rule table and report its version and digest

Options:
  --rules FILE              Capability rule table (.json or .cm) (required)
  --schema-dir DIR          Path to schema directory (default: ./schemas when present)
  --help, -h                Show this help
)");
}

struct AnalyzeOptions
{
    std::vector<std::string> inputs;
    std::string rules;
    std::string output;
    std::optional<unsigned> jobs;
    std::optional<std::string> schema_dir;  ///< Unset: "schemas" if present
    std::string config;
    std::optional<std::string> indirect_policy;
    std::optional<std::uint64_t> max_time_ms;
    bool strict;
    bool edges;
    std::string log_level;
    std::string log_file;
    bool show_help;
};

struct CheckRulesOptions
{
    std::string rules;
    std::optional<std::string> schema_dir;
    bool show_help;
};

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> capslock::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(capslock::Error::make(
            "MissingArgument", std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

template <typename T>
[[nodiscard]] capslock::Result<T> parse_unsigned_value(std::string_view value, std::string_view option)
{
    T parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(capslock::Error::make(
            "InvalidArgument",
            fmt::format("Invalid {} value: {}", option, value)));
    }
    return parsed;
}

[[nodiscard]] auto set_analyze_option(std::string_view arg,
                                      // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                      std::span<char*> args,
                                      std::size_t idx,
                                      AnalyzeOptions& options,
                                      bool& skip_next) -> capslock::Result<bool>
{
    if (arg == "--strict") {
        options.strict = true;
        return true;
    }
    if (arg == "--edges") {
        options.edges = true;
        return true;
    }

    const bool takes_value = arg == "--ir" || arg == "--rules" || arg == "--output" || arg == "-o"
                             || arg == "--jobs" || arg == "-j" || arg == "--schema-dir"
                             || arg == "--config" || arg == "--indirect-policy"
                             || arg == "--max-time-ms" || arg == "--log-level" || arg == "--log-file";
    if (!takes_value) {
        return false;
    }
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    skip_next = true;

    if (arg == "--ir") {
        options.inputs.push_back(*value);
    } else if (arg == "--rules") {
        options.rules = *value;
    } else if (arg == "--output" || arg == "-o") {
        options.output = *value;
    } else if (arg == "--jobs" || arg == "-j") {
        auto parsed = parse_unsigned_value<unsigned>(*value, "--jobs");
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.jobs = *parsed;
    } else if (arg == "--schema-dir") {
        options.schema_dir = *value;
    } else if (arg == "--config") {
        options.config = *value;
    } else if (arg == "--indirect-policy") {
        options.indirect_policy = *value;
    } else if (arg == "--max-time-ms") {
        auto parsed = parse_unsigned_value<std::uint64_t>(*value, "--max-time-ms");
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.max_time_ms = *parsed;
    } else if (arg == "--log-level") {
        options.log_level = *value;
    } else {
        options.log_file = *value;
    }
    return true;
}

[[nodiscard]] capslock::Result<AnalyzeOptions> parse_analyze_args(std::span<char*> args)
{
    AnalyzeOptions options{.inputs = {},
                           .rules = std::string{},
                           .output = std::string{},
                           .jobs = std::nullopt,
                           .schema_dir = std::nullopt,
                           .config = std::string{},
                           .indirect_policy = std::nullopt,
                           .max_time_ms = std::nullopt,
                           .strict = false,
                           .edges = false,
                           .log_level = std::string{},
                           .log_file = std::string{},
                           .show_help = false};
    bool skip_next = false;
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_analyze_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(capslock::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] capslock::Result<CheckRulesOptions> parse_check_rules_args(std::span<char*> args)
{
    CheckRulesOptions options{.rules = std::string{}, .schema_dir = std::nullopt, .show_help = false};
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg != "--rules" && arg != "--schema-dir") {
            return std::unexpected(capslock::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (arg == "--rules") {
            options.rules = *value;
        } else {
            options.schema_dir = *value;
        }
        ++idx;
    }
    return options;
}

constexpr std::string_view kDefaultSchemaDir = "schemas";

/**
 * An explicit --schema-dir must exist. Without one, "schemas" is used when
 * present and schema validation is skipped otherwise.
 */
[[nodiscard]] capslock::Result<std::filesystem::path>
resolve_schema_dir(const std::optional<std::string>& requested)
{
    std::error_code ec;
    if (requested.has_value()) {
        if (!std::filesystem::is_directory(*requested, ec)) {
            return std::unexpected(capslock::Error::make(capslock::error_code::kConfigurationError,
                                                         "schema directory not found: " + *requested));
        }
        return std::filesystem::path(*requested);
    }
    if (!std::filesystem::is_directory(kDefaultSchemaDir, ec)) {
        CAPSLOCK_LOG_WARN(kCore,
                          "no '{}' directory; JSON Schema validation is disabled (use --schema-dir)",
                          kDefaultSchemaDir);
        return std::filesystem::path{};
    }
    return std::filesystem::path(kDefaultSchemaDir);
}

[[nodiscard]] capslock::Result<capslock::EngineConfig> build_engine_config(const AnalyzeOptions& options)
{
    auto schema_dir = resolve_schema_dir(options.schema_dir);
    if (!schema_dir) {
        return std::unexpected(schema_dir.error());
    }
    capslock::EngineConfig config;
    config.schema_dir = std::move(*schema_dir);
    if (!options.config.empty()) {
        auto loaded = capslock::load_config(options.config, config);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    if (options.jobs.has_value()) {
        config.jobs = *options.jobs;
    }
    if (options.indirect_policy.has_value()) {
        auto policy = capslock::parse_indirect_policy(*options.indirect_policy);
        if (!policy) {
            return std::unexpected(policy.error());
        }
        config.indirect_policy = *policy;
    }
    if (options.max_time_ms.has_value()) {
        config.budget.max_time_ms = options.max_time_ms;
    }
    config.strict = config.strict || options.strict;
    config.include_edges = config.include_edges || options.edges;
    return config;
}

[[nodiscard]] int run_analyze(const AnalyzeOptions& options)
{
    capslock::init_logging(capslock::build_log_config(options.log_level, options.log_file));
    auto config = build_engine_config(options);
    if (!config) {
        fmt::print(stderr, "Error: {}: {}\n", config.error().code, config.error().message);
        return 1;
    }
    if (options.log_level.empty() && config->log_level.has_value()) {
        // A config-file level ranks below --log-level and above CAPSLOCK_LOG.
        capslock::init_logging(capslock::build_log_config(*config->log_level, options.log_file));
    }

    auto table = capslock::rules::RuleTable::load(options.rules, config->schema_dir);
    if (!table) {
        fmt::print(stderr, "Error: {}: {}\n", table.error().code, table.error().message);
        return 1;
    }

    std::vector<std::filesystem::path> inputs(options.inputs.begin(), options.inputs.end());
    const capslock::Engine engine(*config);
    auto analysis = engine.analyze(inputs, *table);
    if (!analysis) {
        fmt::print(stderr, "Error: {}: {}\n", analysis.error().code, analysis.error().message);
        return 1;
    }

    auto report = capslock::report::build_report(
        *analysis, *table, capslock::report::ReportOptions{.include_edges = config->include_edges});
    if (!report) {
        fmt::print(stderr, "Error: {}: {}\n", report.error().code, report.error().message);
        return 1;
    }

    if (options.output.empty()) {
        auto canonical = capslock::canonical::canonicalize(*report);
        if (!canonical) {
            fmt::print(stderr, "Error: {}: {}\n", canonical.error().code, canonical.error().message);
            return 1;
        }
        fmt::print("{}\n", *canonical);
    } else if (auto written = capslock::canonical::write_canonical_json_file(options.output, *report);
               !written) {
        fmt::print(stderr, "Error: {}: {}\n", written.error().code, written.error().message);
        return 1;
    }
    capslock::shutdown_logging();
    return 0;
}

[[nodiscard]] int run_check_rules(const CheckRulesOptions& options)
{
    capslock::init_logging(capslock::build_log_config(""));
    auto schema_dir = resolve_schema_dir(options.schema_dir);
    if (!schema_dir) {
        fmt::print(stderr, "Error: {}: {}\n", schema_dir.error().code, schema_dir.error().message);
        return 1;
    }
    auto table = capslock::rules::RuleTable::load(options.rules, *schema_dir);
    if (!table) {
        fmt::print(stderr, "Error: {}: {}\n", table.error().code, table.error().message);
        return 1;
    }
    fmt::print("[check-rules] {} rules OK\n", table->rules().size());
    fmt::print("  version: {}\n", table->version());
    fmt::print("  digest:  {}\n", table->digest());
    return 0;
}

int cmd_analyze(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_analyze_args(args);
    if (!options) {
        fmt::print(stderr, "Error: {}\n", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_analyze_help();
        return 0;
    }
    if (options->inputs.empty() || options->rules.empty()) {
        fmt::print(stderr, "Error: --ir and --rules are required\n");
        print_analyze_help();
        return 1;
    }
    return run_analyze(*options);
}

int cmd_check_rules(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_check_rules_args(args);
    if (!options) {
        fmt::print(stderr, "Error: {}\n", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_check_rules_help();
        return 0;
    }
    if (options->rules.empty()) {
        fmt::print(stderr, "Error: --rules is required\n");
        print_check_rules_help();
        return 1;
    }
    return run_check_rules(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "analyze") {
            return cmd_analyze(sub_argc, sub_argv);
        }
        if (cmd == "check-rules") {
            return cmd_check_rules(sub_argc, sub_argv);
        }

        fmt::print(stderr, "Unknown command: {}\n", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        fmt::print(stderr, "Error: {}\n", ex.what());
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
