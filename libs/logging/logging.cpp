/**
 * @file logging.cpp
 * @brief Logging infrastructure implementation
 */

#include "capslock/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace capslock {

namespace {

constexpr std::array<std::string_view, kLogCategoryCount> kCategoryNames = {
    "core", "loader", "graph", "rules", "propagate", "attribution"};

std::array<std::shared_ptr<spdlog::logger>, kLogCategoryCount> g_loggers;
std::vector<spdlog::sink_ptr> g_sinks;
std::atomic<bool> g_initialized{false};
std::mutex g_init_mutex;

[[nodiscard]] std::string to_lower(std::string_view text)
{
    std::string lower(text);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

[[nodiscard]] std::string_view trim(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

void init_locked(const LogConfig& config)
{
    if (g_initialized.load(std::memory_order_acquire)) {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            g_loggers[i]->set_level(config.category_levels[i].value_or(config.default_level));
        }
        return;
    }

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);
        console_sink->set_pattern("[%^%l%$] [%n] %v");
        g_sinks.push_back(std::move(console_sink));
    }
    if (!config.log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, true);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [t%t] %v");
        g_sinks.push_back(std::move(file_sink));
    }

    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        auto logger = std::make_shared<spdlog::logger>(std::string("capslock.") + std::string(kCategoryNames[i]),
                                                       g_sinks.begin(),
                                                       g_sinks.end());
        const auto level = config.category_levels[i].value_or(config.default_level);
        logger->set_level(level);
        logger->flush_on(level <= spdlog::level::debug ? spdlog::level::trace : spdlog::level::warn);
        g_loggers[i] = std::move(logger);
    }
    g_initialized.store(true, std::memory_order_release);
}

}  // namespace

std::string_view category_name(LogCategory category)
{
    return kCategoryNames[static_cast<std::size_t>(category)];
}

void init_logging(const LogConfig& config)
{
    std::lock_guard<std::mutex> lock(g_init_mutex);
    init_locked(config);
}

void shutdown_logging()
{
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (!g_initialized.load(std::memory_order_acquire)) {
        return;
    }
    for (auto& logger : g_loggers) {
        logger->flush();
    }
    g_initialized.store(false, std::memory_order_release);
    for (auto& logger : g_loggers) {
        logger.reset();
    }
    g_sinks.clear();
}

std::shared_ptr<spdlog::logger> get_logger(LogCategory category)
{
    if (!g_initialized.load(std::memory_order_acquire)) {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        if (!g_initialized.load(std::memory_order_acquire)) {
            init_locked(build_log_config({}));
        }
    }
    return g_loggers[static_cast<std::size_t>(category)];
}

void set_all_levels(spdlog::level::level_enum level)
{
    std::lock_guard<std::mutex> lock(g_init_mutex);
    for (auto& logger : g_loggers) {
        if (logger) {
            logger->set_level(level);
        }
    }
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text)
{
    const std::string lower = to_lower(trim(text));
    if (lower == "trace") {
        return spdlog::level::trace;
    }
    if (lower == "debug") {
        return spdlog::level::debug;
    }
    if (lower == "info") {
        return spdlog::level::info;
    }
    if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    if (lower == "critical") {
        return spdlog::level::critical;
    }
    if (lower == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

std::optional<LogCategory> category_from_name(std::string_view name)
{
    const std::string lower = to_lower(trim(name));
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        if (kCategoryNames[i] == lower) {
            return static_cast<LogCategory>(i);
        }
    }
    if (lower == "callgraph") {
        return LogCategory::kGraph;
    }
    return std::nullopt;
}

void apply_log_filter(LogConfig& config, std::string_view filter)
{
    while (!filter.empty()) {
        const auto comma = filter.find(',');
        const std::string_view entry = trim(filter.substr(0, comma));
        filter = comma == std::string_view::npos ? std::string_view{} : filter.substr(comma + 1);

        const auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            if (auto level = parse_log_level(entry)) {
                config.default_level = *level;
            }
            continue;
        }
        auto category = category_from_name(entry.substr(0, eq));
        auto level = parse_log_level(entry.substr(eq + 1));
        if (category && level) {
            config.category_levels[static_cast<std::size_t>(*category)] = *level;
        }
    }
}

LogConfig build_log_config(std::string_view cli_level, std::string log_file)
{
    LogConfig config;
    config.log_file = std::move(log_file);
    if (const char* env_filter = std::getenv(kLogEnvVar)) {
        apply_log_filter(config, env_filter);
    }
    if (!cli_level.empty()) {
        apply_log_filter(config, cli_level);
    }
    return config;
}

}  // namespace capslock
