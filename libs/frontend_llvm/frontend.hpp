#pragma once

/**
 * @file frontend.hpp
 * @brief LLVM bitcode / textual IR frontend producing CIR modules
 */

#include "capslock/common.hpp"
#include "capslock/ir.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace capslock::frontend_llvm {

struct FrontendOptions
{
    bool strict = false;
    std::string unit;  ///< Overrides the unit derived from the file name
};

class FrontendLlvm
{
public:
    explicit FrontendLlvm(FrontendOptions options = {});

    [[nodiscard]] capslock::Result<ir::Module> load(const std::filesystem::path& path) const;

private:
    FrontendOptions m_options;
};

/**
 * Library unit of a demangled symbol: its leading path component
 * ("core::ptr::drop_in_place" -> "core", "<alloc::vec::Vec<T> as Drop>::drop" -> "alloc").
 * Returns fallback for names without a path.
 */
[[nodiscard]] std::string unit_from_display_name(std::string_view display_name,
                                                 std::string_view fallback);

/// Demangle Itanium, Rust v0 and Rust legacy symbols; strips legacy "::h<hash>" suffixes.
[[nodiscard]] std::string demangle_symbol(const std::string& symbol);

}  // namespace capslock::frontend_llvm
