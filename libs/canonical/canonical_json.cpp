/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "capslock/canonical_json.hpp"

#include "capslock/common.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

#include <fmt/format.h>

namespace capslock::canonical {

namespace {

capslock::VoidResult validate_no_float(const nlohmann::json& j, const std::string& path)
{
    if (j.is_number_float()) {
        return std::unexpected(Error::make(
            "FloatingPointNotAllowed",
            fmt::format("Floating point numbers not allowed in canonical JSON at: {}", path)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = validate_no_float(val, path + "." + key); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        for (std::size_t i = 0; i < j.size(); ++i) {
            if (auto result = validate_no_float(j[i], fmt::format("{}[{}]", path, i)); !result) {
                return result;
            }
        }
    }
    return {};
}

/**
 * @brief Recursively create a sorted copy of JSON (keys in lexicographic order)
 */
[[nodiscard]] nlohmann::json make_sorted_copy(const nlohmann::json& j)
{
    if (j.is_object()) {
        std::vector<std::string> keys;
        keys.reserve(j.size());
        for (const auto& [key, _] : j.items()) {
            keys.push_back(key);
        }
        std::ranges::sort(keys);

        nlohmann::json result = nlohmann::json::object();
        for (const auto& key : keys) {
            result[key] = make_sorted_copy(j.at(key));
        }
        return result;
    }
    if (j.is_array()) {
        nlohmann::json result = nlohmann::json::array();
        result.get_ref<nlohmann::json::array_t&>().reserve(j.size());
        for (const auto& elem : j) {
            result.push_back(make_sorted_copy(elem));
        }
        return result;
    }
    return j;
}

}  // namespace

capslock::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto result = validate_no_float(j, "$"); !result) {
        return std::unexpected(result.error());
    }

    nlohmann::json sorted = make_sorted_copy(j);
    try {
        return sorted.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("InvalidUtf8", fmt::format("Canonical JSON serialization failed: {}", ex.what())));
    }
}

capslock::Result<std::string> hash_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

capslock::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    return validate_no_float(j, "$");
}

capslock::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                               const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(Error::make(error_code::kIoError,
                                               fmt::format("Failed to create directory {}: {}",
                                                           path.parent_path().string(),
                                                           ec.message())));
        }
    }

    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return std::unexpected(
            Error::make(error_code::kIoError, "Failed to open output file: " + path.string()));
    }
    out << *canonical << '\n';
    if (!out) {
        return std::unexpected(
            Error::make(error_code::kIoError, "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace capslock::canonical
