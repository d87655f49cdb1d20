#pragma once

/**
 * @file loader.hpp
 * @brief IR loader: cir.v1 JSON documents and, when built, LLVM bitcode
 */

#include "capslock/common.hpp"
#include "capslock/ir.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace capslock::loader {

struct LoadOptions
{
    std::filesystem::path schema_dir;  ///< Empty disables JSON Schema validation
    bool strict = false;               ///< Fail on UnsupportedConstruct instead of recording a gap
};

/**
 * Build a Module from a parsed cir.v1 document.
 *
 * @param doc Parsed JSON document
 * @param source Artifact name used in error messages and as default source_path
 * @return Module, or MalformedInput / UnsupportedConstruct (strict only)
 */
[[nodiscard]] capslock::Result<ir::Module>
parse_module(const nlohmann::json& doc, std::string_view source, const LoadOptions& options);

/**
 * Load one artifact. ".bc" and ".ll" go through the LLVM frontend,
 * everything else is read as cir.v1 JSON.
 */
[[nodiscard]] capslock::Result<ir::Module> load_module(const std::filesystem::path& path,
                                                       const LoadOptions& options);

/**
 * Load the whole dependency closure. Modules are ordered by module_id.
 * A repeated module_id is MalformedInput.
 */
[[nodiscard]] capslock::Result<ir::Program>
load_program(const std::vector<std::filesystem::path>& paths, const LoadOptions& options);

[[nodiscard]] bool is_llvm_artifact(const std::filesystem::path& path);

/// True when the LLVM frontend was compiled in.
[[nodiscard]] bool llvm_frontend_available();

}  // namespace capslock::loader
