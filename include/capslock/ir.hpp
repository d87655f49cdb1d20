#pragma once

/**
 * @file ir.hpp
 * @brief Capability IR (CIR) data structures produced by the loaders
 *
 * A Module is immutable once loaded. Call sites keep the order of the
 * instructions they were read from.
 */

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace capslock::ir {

struct Location
{
    std::string file;
    int line = 0;
    int col = 0;
};

/**
 * @brief Static function type used to match indirect call targets
 */
struct Signature
{
    std::string return_type;
    std::vector<std::string> params;
    bool variadic = false;

    /// Stable textual key, e.g. "fn(i32,...)->i32"
    [[nodiscard]] std::string key() const;

    friend bool operator==(const Signature&, const Signature&) = default;
};

enum class CallKind {
    kDirect,
    kIndirect,
};

struct CallInst
{
    std::string id;
    CallKind kind = CallKind::kDirect;
    std::string callee;                           ///< kDirect: target symbol
    Signature signature;                          ///< kIndirect: static call type
    std::optional<std::vector<std::string>> candidates;  ///< kIndirect: enumerated targets
    std::optional<Location> src;
};

/**
 * @brief A construct the loader had no model for
 *
 * code is error_code::kUnsupportedConstruct for IR constructs, or
 * error_code::kUnresolvedExternalCall when added by the call graph builder.
 */
struct Gap
{
    std::string site_id;
    std::string code;
    std::string detail;
    std::optional<Location> src;
};

struct Function
{
    std::string symbol;        ///< Mangled symbol, unique across the closure
    std::string display_name;  ///< Demangled name (defaults to symbol)
    std::string unit;          ///< Provenance (library unit name)
    bool external = false;     ///< No body in this module
    bool entry = false;        ///< Public entry point of its unit
    bool address_taken = false;
    Signature signature;
    std::vector<CallInst> calls;
    std::vector<Gap> gaps;
    std::optional<Location> src;
};

struct GlobalValue
{
    std::string symbol;
    std::vector<std::string> refs;  ///< Functions referenced by the initializer
};

struct Module
{
    std::string schema_version;
    std::string module_id;
    std::string unit;
    std::string source_path;
    std::string input_digest;
    std::vector<Function> functions;
    std::vector<GlobalValue> globals;
    std::vector<std::string> address_refs;  ///< Symbols whose address is taken by code
};

/// The whole dependency closure, loaded together.
struct Program
{
    std::vector<Module> modules;
};

void to_json(nlohmann::json& j, const Location& loc);
void to_json(nlohmann::json& j, const Signature& signature);
void to_json(nlohmann::json& j, const Gap& gap);

}  // namespace capslock::ir
