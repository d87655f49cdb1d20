/**
 * @file path.cpp
 * @brief Path normalization for deterministic location tokens
 */

#include "capslock/common.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace capslock::common {

namespace {

[[nodiscard]] std::vector<std::string> split_path(std::string_view path)
{
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (!current.empty()) {
                parts.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

struct PrefixInfo
{
    std::string prefix;
    std::size_t start;
};

[[nodiscard]] PrefixInfo extract_prefix(std::string_view path)
{
    PrefixInfo info{.prefix = std::string{}, .start = 0};
    if (path.size() >= 2 && path[1] == ':') {
        info.prefix = std::string(1, static_cast<char>(std::tolower(path[0]))) + ":";
        info.start = 2;
        return info;
    }
    return info;
}

[[nodiscard]] std::vector<std::string> resolve_parts(const std::vector<std::string>& parts,
                                                     bool absolute_input)
{
    std::vector<std::string> resolved;
    for (const auto& part : parts) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!resolved.empty() && resolved.back() != "..") {
                resolved.pop_back();
                continue;
            }
            if (!absolute_input) {
                resolved.emplace_back("..");
            }
            continue;
        }
        resolved.push_back(part);
    }
    return resolved;
}

[[nodiscard]] std::string join_parts(const std::vector<std::string>& parts)
{
    std::string result;
    for (const auto& part : parts) {
        if (!result.empty()) {
            result += '/';
        }
        result += part;
    }
    return result;
}

}  // namespace

bool is_absolute_path(std::string_view path)
{
    if (path.empty()) {
        return false;
    }
    if (path[0] == '/' || path[0] == '\\') {
        return true;
    }
    return path.size() >= 3 && std::isalpha(static_cast<unsigned char>(path[0])) != 0
           && path[1] == ':' && (path[2] == '/' || path[2] == '\\');
}

std::string normalize_path(std::string_view input)
{
    if (input.empty()) {
        return ".";
    }
    const PrefixInfo prefix_info = extract_prefix(input);
    const bool absolute_input = is_absolute_path(input);

    std::string normalized =
        join_parts(resolve_parts(split_path(input.substr(prefix_info.start)), absolute_input));
    if (!prefix_info.prefix.empty()) {
        normalized = prefix_info.prefix + "/" + normalized;
    } else if (absolute_input) {
        normalized = "/" + normalized;
    }
    return normalized.empty() ? "." : normalized;
}

std::string join_source_path(std::string_view directory, std::string_view filename)
{
    if (filename.empty()) {
        return directory.empty() ? std::string{} : normalize_path(directory);
    }
    if (directory.empty() || is_absolute_path(filename)) {
        return normalize_path(filename);
    }
    std::string joined(directory);
    joined += '/';
    joined += filename;
    return normalize_path(joined);
}

}  // namespace capslock::common
