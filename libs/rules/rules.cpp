/**
 * @file rules.cpp
 * @brief Capability rule table loading and most-specific-pattern matching
 */

#include "capslock/rules.hpp"

#include "capslock/canonical_json.hpp"
#include "capslock/logging.hpp"
#include "capslock/schema_validate.hpp"
#include "capslock/version.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

#include <fmt/format.h>

namespace capslock::rules {

namespace {

[[nodiscard]] Error config_error(std::string message)
{
    return Error::make(error_code::kConfigurationError, std::move(message));
}

[[nodiscard]] std::vector<std::string> split_fields(std::string_view line)
{
    std::vector<std::string> fields;
    std::size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])) != 0) {
            ++pos;
        }
        const std::size_t start = pos;
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])) == 0) {
            ++pos;
        }
        if (pos > start) {
            fields.emplace_back(line.substr(start, pos - start));
        }
    }
    return fields;
}

[[nodiscard]] bool is_comment_or_blank(std::string_view line)
{
    for (char c : line) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            continue;
        }
        return c == '#';
    }
    return true;
}

[[nodiscard]] nlohmann::json rules_to_json(const std::vector<CapabilityRule>& rules)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto& rule : rules) {
        nlohmann::json caps = nlohmann::json::array();
        for (Capability capability : rule.capabilities.to_vector()) {
            caps.push_back(std::string(to_string(capability)));
        }
        out.push_back(nlohmann::json{
            {     "pattern", rule.pattern},
            {"capabilities",         caps}
        });
    }
    return out;
}

[[nodiscard]] capslock::Result<std::string> read_text(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(config_error("Failed to open rule table: " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

std::string_view to_string(PatternKind kind)
{
    switch (kind) {
        case PatternKind::kExact:
            return "exact";
        case PatternKind::kPrefix:
            return "prefix";
        case PatternKind::kCatchAll:
            return "catch_all";
    }
    return "exact";
}

capslock::Result<CapabilityRule> make_rule(std::string pattern,
                                           const std::vector<std::string>& capabilities,
                                           std::size_t index)
{
    CapabilityRule rule;
    rule.index = index;
    if (pattern.empty()) {
        return std::unexpected(config_error(fmt::format("rule {} has an empty pattern", index)));
    }
    if (capabilities.empty()) {
        return std::unexpected(
            config_error(fmt::format("rule {} ({}) lists no capabilities", index, pattern)));
    }

    const auto star = pattern.find('*');
    if (pattern == "*") {
        rule.kind = PatternKind::kCatchAll;
    } else if (star == std::string::npos) {
        rule.kind = PatternKind::kExact;
        rule.stem = pattern;
    } else if (star == pattern.size() - 1) {
        rule.kind = PatternKind::kPrefix;
        rule.stem = pattern.substr(0, star);
    } else {
        return std::unexpected(config_error(
            fmt::format("rule {} ({}): '*' is only allowed at the end of a pattern", index, pattern)));
    }

    bool safe = false;
    for (const auto& name : capabilities) {
        if (is_safe_marker(name)) {
            safe = true;
            continue;
        }
        auto capability = parse_capability(name);
        if (!capability) {
            return std::unexpected(config_error(
                fmt::format("rule {} ({}): unknown capability '{}'", index, pattern, name)));
        }
        rule.capabilities.insert(*capability);
    }
    if (safe && !rule.capabilities.empty()) {
        return std::unexpected(config_error(
            fmt::format("rule {} ({}): SAFE cannot be combined with capabilities", index, pattern)));
    }
    rule.pattern = std::move(pattern);
    return rule;
}

RuleTable::RuleTable(std::string version, std::vector<CapabilityRule> rules)
    : m_version(std::move(version))
    , m_rules(std::move(rules))
{
    for (std::size_t i = 0; i < m_rules.size(); ++i) {
        m_rules[i].index = i;
        switch (m_rules[i].kind) {
            case PatternKind::kExact:
                m_exact[m_rules[i].stem].push_back(i);
                break;
            case PatternKind::kPrefix:
                m_prefix.push_back(i);
                break;
            case PatternKind::kCatchAll:
                m_catch_all.push_back(i);
                break;
        }
    }
    std::ranges::stable_sort(m_prefix, [this](std::size_t lhs, std::size_t rhs) {
        return m_rules[lhs].stem.size() > m_rules[rhs].stem.size();
    });

    const nlohmann::json digest_input = {
        {"version", m_version},
        {  "rules", rules_to_json(m_rules)}
    };
    // Rule JSON holds only strings, so hashing cannot fail.
    m_digest = canonical::hash_canonical(digest_input).value_or(std::string{});
}

capslock::Result<RuleTable> RuleTable::from_json(const nlohmann::json& doc,
                                                 const std::filesystem::path& schema_dir)
{
    if (!doc.is_object()) {
        return std::unexpected(config_error("rule table must be a JSON object"));
    }
    if (!schema_dir.empty()) {
        const auto schema_path = schema_dir / "caps_rules.v1.schema.json";
        if (auto valid = common::validate_json(doc, schema_path.string()); !valid) {
            return std::unexpected(config_error("invalid rule table: " + valid.error().message));
        }
    }
    if (!doc.contains("schema_version") || doc.at("schema_version") != kRulesSchemaVersion) {
        return std::unexpected(config_error(
            fmt::format("rule table schema_version must be '{}'", kRulesSchemaVersion)));
    }
    if (!doc.contains("version") || !doc.at("version").is_string()) {
        return std::unexpected(config_error("rule table needs a string 'version'"));
    }
    if (!doc.contains("rules") || !doc.at("rules").is_array()) {
        return std::unexpected(config_error("rule table needs a 'rules' array"));
    }

    std::vector<CapabilityRule> rules;
    const auto& raw_rules = doc.at("rules");
    rules.reserve(raw_rules.size());
    for (std::size_t i = 0; i < raw_rules.size(); ++i) {
        const auto& raw = raw_rules[i];
        if (!raw.is_object() || !raw.contains("pattern") || !raw.at("pattern").is_string()
            || !raw.contains("capabilities") || !raw.at("capabilities").is_array()) {
            return std::unexpected(
                config_error(fmt::format("rule {} needs 'pattern' and 'capabilities'", i)));
        }
        std::vector<std::string> capabilities;
        for (const auto& cap : raw.at("capabilities")) {
            if (!cap.is_string()) {
                return std::unexpected(
                    config_error(fmt::format("rule {} has a non-string capability", i)));
            }
            capabilities.push_back(cap.get<std::string>());
        }
        auto rule = make_rule(raw.at("pattern").get<std::string>(), capabilities, i);
        if (!rule) {
            return std::unexpected(rule.error());
        }
        rules.push_back(std::move(*rule));
    }
    return RuleTable(doc.at("version").get<std::string>(), std::move(rules));
}

capslock::Result<RuleTable> RuleTable::from_capability_map(std::string_view text,
                                                           std::string_view source)
{
    std::vector<CapabilityRule> rules;
    std::size_t line_no = 0;
    while (!text.empty()) {
        ++line_no;
        const auto newline = text.find('\n');
        std::string_view line = text.substr(0, newline);
        text = newline == std::string_view::npos ? std::string_view{} : text.substr(newline + 1);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (is_comment_or_blank(line)) {
            continue;
        }
        auto fields = split_fields(line);
        if (fields.size() < 2) {
            return std::unexpected(
                config_error(fmt::format("{}:{}: insufficient fields", source, line_no)));
        }
        std::string pattern = std::move(fields.front());
        fields.erase(fields.begin());
        auto rule = make_rule(std::move(pattern), fields, rules.size());
        if (!rule) {
            return std::unexpected(config_error(
                fmt::format("{}:{}: {}", source, line_no, rule.error().message)));
        }
        rules.push_back(std::move(*rule));
    }
    return RuleTable(std::string(source), std::move(rules));
}

capslock::Result<RuleTable> RuleTable::load(const std::filesystem::path& path,
                                            const std::filesystem::path& schema_dir)
{
    auto text = read_text(path);
    if (!text) {
        return std::unexpected(text.error());
    }

    capslock::Result<RuleTable> table = std::unexpected(Error{});
    if (path.extension() == ".cm") {
        table = from_capability_map(*text, path.filename().string());
    } else {
        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(*text);
        } catch (const nlohmann::json::parse_error& ex) {
            return std::unexpected(
                config_error(fmt::format("{}: rule table is not valid JSON: {}", path.string(), ex.what())));
        }
        table = from_json(doc, schema_dir);
    }
    if (table) {
        CAPSLOCK_LOG_INFO(kRules,
                          "loaded {} rules from {} (version {})",
                          table->rules().size(),
                          path.string(),
                          table->version());
    }
    return table;
}

std::optional<RuleMatch>
RuleTable::match(std::string_view symbol, std::string_view display_name, bool is_external) const
{
    const auto make_match = [this](std::vector<std::size_t> hits) -> std::optional<RuleMatch> {
        if (hits.empty()) {
            return std::nullopt;
        }
        std::ranges::sort(hits);
        auto [first, last] = std::ranges::unique(hits);
        hits.erase(first, last);
        RuleMatch result;
        result.rule = &m_rules[hits.front()];
        for (std::size_t i = 1; i < hits.size(); ++i) {
            result.tied.push_back(&m_rules[hits[i]]);
        }
        return result;
    };

    std::vector<std::size_t> hits;
    for (std::string_view name : {symbol, display_name}) {
        if (auto it = m_exact.find(std::string(name)); it != m_exact.end()) {
            hits.insert(hits.end(), it->second.begin(), it->second.end());
        }
    }
    if (!hits.empty()) {
        return make_match(std::move(hits));
    }

    std::size_t best_length = 0;
    for (std::size_t index : m_prefix) {
        const auto& rule = m_rules[index];
        if (!hits.empty() && rule.stem.size() < best_length) {
            break;
        }
        if (symbol.starts_with(rule.stem) || display_name.starts_with(rule.stem)) {
            best_length = rule.stem.size();
            hits.push_back(index);
        }
    }
    if (!hits.empty()) {
        return make_match(std::move(hits));
    }

    if (is_external) {
        return make_match(m_catch_all);
    }
    return std::nullopt;
}

}  // namespace capslock::rules
