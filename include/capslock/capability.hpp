#pragma once

/**
 * @file capability.hpp
 * @brief Closed capability taxonomy and capability sets
 *
 * Declaration order of Capability is the output order everywhere.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>

namespace capslock {

enum class Capability : std::uint8_t {
    kFilesystem,
    kNetwork,
    kProcessExec,
    kUnsafePointer,
    kFfi,
    kEnvironment,
    kArbitraryMemory,
    kReadSystemState,
    kModifySystemState,
    kOperatingSystem,
    kSystemCalls,
    kArbitraryExecution,
    kDynamicLoading,
    kReflect,
    kRuntime,
    kInstrumentation,
    kUnanalyzed,  ///< Capability-relevance could not be determined; never dropped
};

inline constexpr std::size_t kCapabilityCount = 17;

/// Canonical taxonomy name, e.g. "FILESYSTEM"
[[nodiscard]] std::string_view to_string(Capability capability);

/**
 * Parse a canonical name or one of the legacy "CAPABILITY_*" spellings.
 * Returns nullopt for unknown names and for the SAFE marker.
 */
[[nodiscard]] std::optional<Capability> parse_capability(std::string_view name);

/// True for "SAFE" / "CAPABILITY_SAFE": a rule that matches but grants nothing.
[[nodiscard]] bool is_safe_marker(std::string_view name);

/// All capabilities in declaration order.
[[nodiscard]] const std::array<Capability, kCapabilityCount>& all_capabilities();

/**
 * @brief How a function holds a capability
 *
 * kDirect: the capability is in the function's intrinsic set.
 * kTransitive: it is only reachable through callees.
 */
enum class CapabilityType : std::uint8_t {
    kDirect,
    kTransitive,
};

[[nodiscard]] std::string_view to_string(CapabilityType type);

/**
 * @brief Fixed-size set of capabilities, iterated in taxonomy order
 */
class CapabilitySet
{
public:
    constexpr CapabilitySet() = default;
    CapabilitySet(std::initializer_list<Capability> capabilities)
    {
        for (Capability capability : capabilities) {
            insert(capability);
        }
    }

    void insert(Capability capability) { m_bits |= bit(capability); }
    void erase(Capability capability) { m_bits &= ~bit(capability); }

    [[nodiscard]] bool contains(Capability capability) const
    {
        return (m_bits & bit(capability)) != 0;
    }

    /// Union in place; returns true if the set grew.
    bool merge(const CapabilitySet& other)
    {
        const std::uint32_t before = m_bits;
        m_bits |= other.m_bits;
        return m_bits != before;
    }

    [[nodiscard]] bool is_subset_of(const CapabilitySet& other) const
    {
        return (m_bits & ~other.m_bits) == 0;
    }

    [[nodiscard]] bool empty() const { return m_bits == 0; }
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<Capability> to_vector() const;

    friend bool operator==(const CapabilitySet&, const CapabilitySet&) = default;

private:
    [[nodiscard]] static constexpr std::uint32_t bit(Capability capability)
    {
        return std::uint32_t{1} << static_cast<unsigned>(capability);
    }

    std::uint32_t m_bits = 0;
};

}  // namespace capslock
