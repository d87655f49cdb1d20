/**
 * @file config.cpp
 * @brief caps_config.v1 parsing
 */

#include "capslock/config.hpp"

#include "capslock/logging.hpp"
#include "capslock/schema_validate.hpp"
#include "capslock/version.hpp"

#include <fstream>
#include <limits>
#include <utility>

#include <fmt/format.h>

namespace capslock {

namespace {

[[nodiscard]] Error config_error(std::string message)
{
    return Error::make(error_code::kConfigurationError, std::move(message));
}

}  // namespace

capslock::Result<callgraph::IndirectPolicy> parse_indirect_policy(std::string_view text)
{
    if (text == "signature") {
        return callgraph::IndirectPolicy::kSignature;
    }
    if (text == "address_taken") {
        return callgraph::IndirectPolicy::kAddressTaken;
    }
    return std::unexpected(config_error(
        fmt::format("unknown indirect_policy '{}' (expected signature or address_taken)", text)));
}

std::string_view to_string(callgraph::IndirectPolicy policy)
{
    switch (policy) {
        case callgraph::IndirectPolicy::kSignature:
            return "signature";
        case callgraph::IndirectPolicy::kAddressTaken:
            return "address_taken";
    }
    return "signature";
}

capslock::Result<EngineConfig> apply_config(const nlohmann::json& doc, EngineConfig base)
{
    if (!doc.is_object()) {
        return std::unexpected(config_error("configuration must be a JSON object"));
    }
    if (!doc.contains("schema_version") || doc.at("schema_version") != kConfigSchemaVersion) {
        return std::unexpected(
            config_error(fmt::format("configuration schema_version must be '{}'", kConfigSchemaVersion)));
    }

    if (doc.contains("jobs")) {
        const auto& jobs = doc.at("jobs");
        if (!jobs.is_number_unsigned() || jobs.get<std::uint64_t>() > std::numeric_limits<unsigned>::max()) {
            return std::unexpected(config_error("'jobs' must be a non-negative integer"));
        }
        base.jobs = jobs.get<unsigned>();
    }
    if (doc.contains("indirect_policy")) {
        if (!doc.at("indirect_policy").is_string()) {
            return std::unexpected(config_error("'indirect_policy' must be a string"));
        }
        auto policy = parse_indirect_policy(doc.at("indirect_policy").get<std::string>());
        if (!policy) {
            return std::unexpected(policy.error());
        }
        base.indirect_policy = *policy;
    }
    for (const char* key : {"strict", "include_edges"}) {
        if (doc.contains(key) && !doc.at(key).is_boolean()) {
            return std::unexpected(config_error(fmt::format("'{}' must be a boolean", key)));
        }
    }
    if (doc.contains("strict")) {
        base.strict = doc.at("strict").get<bool>();
    }
    if (doc.contains("include_edges")) {
        base.include_edges = doc.at("include_edges").get<bool>();
    }
    for (auto [key, limit] : {std::pair{"max_time_ms", &base.budget.max_time_ms},
                              std::pair{"max_functions", &base.budget.max_functions}}) {
        if (!doc.contains(key)) {
            continue;
        }
        if (!doc.at(key).is_number_unsigned()) {
            return std::unexpected(config_error(fmt::format("'{}' must be a non-negative integer", key)));
        }
        *limit = doc.at(key).get<std::uint64_t>();
    }
    if (doc.contains("log_level")) {
        if (!doc.at("log_level").is_string()) {
            return std::unexpected(config_error("'log_level' must be a string"));
        }
        base.log_level = doc.at("log_level").get<std::string>();
    }
    return base;
}

capslock::Result<EngineConfig> load_config(const std::filesystem::path& path, EngineConfig base)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(config_error("Failed to open configuration file: " + path.string()));
    }
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            config_error(fmt::format("{}: configuration is not valid JSON: {}", path.string(), ex.what())));
    }
    if (!base.schema_dir.empty()) {
        const auto schema_path = base.schema_dir / "caps_config.v1.schema.json";
        if (auto valid = common::validate_json(doc, schema_path.string()); !valid) {
            return std::unexpected(config_error("invalid configuration: " + valid.error().message));
        }
    }
    CAPSLOCK_LOG_DEBUG(kCore, "loaded configuration from {}", path.string());
    return apply_config(doc, std::move(base));
}

}  // namespace capslock
