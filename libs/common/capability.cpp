/**
 * @file capability.cpp
 * @brief Capability taxonomy names and set helpers
 */

#include "capslock/capability.hpp"

#include <bit>
#include <string>

namespace capslock {

namespace {

struct CapabilityName
{
    Capability capability;
    std::string_view name;
};

constexpr std::array<CapabilityName, kCapabilityCount> kNames = {{
    {.capability = Capability::kFilesystem, .name = "FILESYSTEM"},
    {.capability = Capability::kNetwork, .name = "NETWORK"},
    {.capability = Capability::kProcessExec, .name = "PROCESS_EXEC"},
    {.capability = Capability::kUnsafePointer, .name = "UNSAFE_POINTER"},
    {.capability = Capability::kFfi, .name = "FFI"},
    {.capability = Capability::kEnvironment, .name = "ENVIRONMENT"},
    {.capability = Capability::kArbitraryMemory, .name = "ARBITRARY_MEMORY"},
    {.capability = Capability::kReadSystemState, .name = "READ_SYSTEM_STATE"},
    {.capability = Capability::kModifySystemState, .name = "MODIFY_SYSTEM_STATE"},
    {.capability = Capability::kOperatingSystem, .name = "OPERATING_SYSTEM"},
    {.capability = Capability::kSystemCalls, .name = "SYSTEM_CALLS"},
    {.capability = Capability::kArbitraryExecution, .name = "ARBITRARY_EXECUTION"},
    {.capability = Capability::kDynamicLoading, .name = "DYNAMIC_LOADING"},
    {.capability = Capability::kReflect, .name = "REFLECT"},
    {.capability = Capability::kRuntime, .name = "RUNTIME"},
    {.capability = Capability::kInstrumentation, .name = "INSTRUMENTATION"},
    {.capability = Capability::kUnanalyzed, .name = "UNANALYZED"},
}};

// Legacy spellings from capability-map (.cm) files whose suffix differs
// from the canonical name. An unspecified capability is treated as unknown.
constexpr std::array<CapabilityName, 5> kLegacyAliases = {{
    {.capability = Capability::kFilesystem, .name = "CAPABILITY_FILES"},
    {.capability = Capability::kProcessExec, .name = "CAPABILITY_EXEC"},
    {.capability = Capability::kFfi, .name = "CAPABILITY_CGO"},
    {.capability = Capability::kFfi, .name = "CAPABILITY_NATIVE_CODE"},
    {.capability = Capability::kUnanalyzed, .name = "CAPABILITY_UNSPECIFIED"},
}};

constexpr std::string_view kLegacyPrefix = "CAPABILITY_";

}  // namespace

std::string_view to_string(Capability capability)
{
    return kNames[static_cast<std::size_t>(capability)].name;
}

std::string_view to_string(CapabilityType type)
{
    switch (type) {
        case CapabilityType::kDirect:
            return "direct";
        case CapabilityType::kTransitive:
            return "transitive";
    }
    return "transitive";
}

std::optional<Capability> parse_capability(std::string_view name)
{
    for (const auto& alias : kLegacyAliases) {
        if (alias.name == name) {
            return alias.capability;
        }
    }
    std::string_view bare = name;
    if (bare.starts_with(kLegacyPrefix)) {
        bare.remove_prefix(kLegacyPrefix.size());
    }
    for (const auto& entry : kNames) {
        if (entry.name == bare) {
            return entry.capability;
        }
    }
    return std::nullopt;
}

bool is_safe_marker(std::string_view name)
{
    return name == "SAFE" || name == "CAPABILITY_SAFE";
}

const std::array<Capability, kCapabilityCount>& all_capabilities()
{
    static const std::array<Capability, kCapabilityCount> kAll = [] {
        std::array<Capability, kCapabilityCount> all{};
        for (std::size_t i = 0; i < kNames.size(); ++i) {
            all[i] = kNames[i].capability;
        }
        return all;
    }();
    return kAll;
}

std::size_t CapabilitySet::size() const
{
    return static_cast<std::size_t>(std::popcount(m_bits));
}

std::vector<Capability> CapabilitySet::to_vector() const
{
    std::vector<Capability> result;
    result.reserve(size());
    for (Capability capability : all_capabilities()) {
        if (contains(capability)) {
            result.push_back(capability);
        }
    }
    return result;
}

}  // namespace capslock
