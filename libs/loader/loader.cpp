/**
 * @file loader.cpp
 * @brief cir.v1 JSON loader and artifact dispatch
 */

#include "capslock/loader.hpp"

#include "capslock/canonical_json.hpp"
#include "capslock/logging.hpp"
#include "capslock/schema_validate.hpp"
#include "capslock/version.hpp"

#if defined(CAPSLOCK_HAS_LLVM_FRONTEND)
#include "frontend_llvm/frontend.hpp"
#endif

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <string>

#include <fmt/format.h>

namespace capslock::loader {

namespace {

constexpr std::array<std::string_view, 16> kOpaqueOps = {
    "alloca", "load", "store", "gep", "cast", "cmp", "binop", "select",
    "phi", "br", "switch", "ret", "unreachable", "landingpad", "resume", "nop"};

[[nodiscard]] bool is_opaque_op(std::string_view op)
{
    return std::ranges::find(kOpaqueOps, op) != kOpaqueOps.end();
}

[[nodiscard]] Error malformed(std::string_view source, std::string_view where, std::string_view what)
{
    return Error::make(error_code::kMalformedInput,
                       fmt::format("{}: {}: {}", source, where, what));
}

/**
 * @brief Per-document parse state
 */
class ModuleParser
{
public:
    ModuleParser(std::string_view source, const LoadOptions& options)
        : m_source(source)
        , m_options(options)
    {}

    [[nodiscard]] capslock::Result<ir::Module> parse(const nlohmann::json& doc);

private:
    [[nodiscard]] capslock::Result<std::string>
    require_string(const nlohmann::json& obj, const char* key, std::string_view where) const
    {
        const auto it = obj.find(key);
        if (it == obj.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
            return std::unexpected(
                malformed(m_source, where, fmt::format("'{}' must be a non-empty string", key)));
        }
        return it->get<std::string>();
    }

    [[nodiscard]] capslock::Result<std::string> optional_string(const nlohmann::json& obj,
                                                                const char* key,
                                                                std::string_view where,
                                                                std::string fallback) const
    {
        const auto it = obj.find(key);
        if (it == obj.end()) {
            return fallback;
        }
        if (!it->is_string()) {
            return std::unexpected(
                malformed(m_source, where, fmt::format("'{}' must be a string", key)));
        }
        return it->get<std::string>();
    }

    [[nodiscard]] capslock::Result<bool> optional_bool(const nlohmann::json& obj,
                                                       const char* key,
                                                       std::string_view where) const
    {
        const auto it = obj.find(key);
        if (it == obj.end()) {
            return false;
        }
        if (!it->is_boolean()) {
            return std::unexpected(
                malformed(m_source, where, fmt::format("'{}' must be a boolean", key)));
        }
        return it->get<bool>();
    }

    [[nodiscard]] static std::optional<ir::Location> parse_location(const nlohmann::json& obj)
    {
        const auto it = obj.find("src");
        if (it == obj.end() || !it->is_object()) {
            return std::nullopt;
        }
        const auto& src = *it;
        ir::Location loc;
        if (src.contains("file") && src.at("file").is_string()) {
            loc.file = common::normalize_path(src.at("file").get<std::string>());
        }
        if (src.contains("line") && src.at("line").is_number_integer()) {
            loc.line = src.at("line").get<int>();
        }
        if (src.contains("col") && src.at("col").is_number_integer()) {
            loc.col = src.at("col").get<int>();
        }
        return loc;
    }

    [[nodiscard]] static std::optional<ir::Signature> parse_signature(const nlohmann::json& value)
    {
        if (!value.is_object() || !value.contains("return_type")
            || !value.at("return_type").is_string()) {
            return std::nullopt;
        }
        ir::Signature signature;
        signature.return_type = value.at("return_type").get<std::string>();
        if (value.contains("params")) {
            if (!value.at("params").is_array()) {
                return std::nullopt;
            }
            for (const auto& param : value.at("params")) {
                if (!param.is_string()) {
                    return std::nullopt;
                }
                signature.params.push_back(param.get<std::string>());
            }
        }
        if (value.contains("variadic")) {
            if (!value.at("variadic").is_boolean()) {
                return std::nullopt;
            }
            signature.variadic = value.at("variadic").get<bool>();
        }
        return signature;
    }

    capslock::VoidResult record_gap(ir::Function& function,
                                    const std::string& site_id,
                                    std::string detail,
                                    std::optional<ir::Location> src)
    {
        if (m_options.strict) {
            return std::unexpected(Error::make(
                error_code::kUnsupportedConstruct,
                fmt::format("{}: {} at {}: {}", m_source, function.symbol, site_id, detail)));
        }
        CAPSLOCK_LOG_WARN(kLoader,
                          "{}: unsupported construct in {} at {}: {}",
                          m_source,
                          function.symbol,
                          site_id,
                          detail);
        function.gaps.push_back(ir::Gap{.site_id = site_id,
                                        .code = error_code::kUnsupportedConstruct,
                                        .detail = std::move(detail),
                                        .src = std::move(src)});
        return {};
    }

    [[nodiscard]] capslock::Result<std::map<std::string, std::vector<std::string>>>
    parse_candidate_tables(const nlohmann::json& fn, std::string_view where) const;

    [[nodiscard]] capslock::VoidResult
    parse_instruction(const nlohmann::json& inst,
                      ir::Function& function,
                      const std::map<std::string, std::vector<std::string>>& tables,
                      std::string_view where);

    [[nodiscard]] capslock::Result<ir::Function>
    parse_function(const nlohmann::json& fn, const std::string& default_unit, std::size_t index);

    std::string m_source;
    const LoadOptions& m_options;
    std::vector<std::string> m_address_refs;
};

capslock::Result<std::map<std::string, std::vector<std::string>>>
ModuleParser::parse_candidate_tables(const nlohmann::json& fn, std::string_view where) const
{
    std::map<std::string, std::vector<std::string>> tables;
    if (!fn.contains("tables")) {
        return tables;
    }
    const auto& raw = fn.at("tables");
    if (!raw.is_object()) {
        return std::unexpected(malformed(m_source, where, "'tables' must be an object"));
    }
    if (!raw.contains("vcall_candidates")) {
        return tables;
    }
    const auto& sets = raw.at("vcall_candidates");
    if (!sets.is_array()) {
        return std::unexpected(malformed(m_source, where, "'vcall_candidates' must be an array"));
    }
    for (const auto& set : sets) {
        if (!set.is_object()) {
            return std::unexpected(malformed(m_source, where, "candidate set must be an object"));
        }
        auto id = require_string(set, "id", where);
        if (!id) {
            return std::unexpected(id.error());
        }
        if (!set.contains("methods") || !set.at("methods").is_array()) {
            return std::unexpected(
                malformed(m_source, where, fmt::format("candidate set {} needs 'methods'", *id)));
        }
        std::vector<std::string> methods;
        for (const auto& method : set.at("methods")) {
            if (!method.is_string()) {
                return std::unexpected(malformed(
                    m_source, where, fmt::format("candidate set {} has a non-string method", *id)));
            }
            methods.push_back(method.get<std::string>());
        }
        if (!tables.emplace(*id, std::move(methods)).second) {
            return std::unexpected(
                malformed(m_source, where, fmt::format("duplicate candidate set {}", *id)));
        }
    }
    return tables;
}

capslock::VoidResult
ModuleParser::parse_instruction(const nlohmann::json& inst,
                                ir::Function& function,
                                const std::map<std::string, std::vector<std::string>>& tables,
                                std::string_view where)
{
    if (!inst.is_object()) {
        return std::unexpected(malformed(m_source, where, "instruction must be an object"));
    }
    auto id = require_string(inst, "id", where);
    if (!id) {
        return std::unexpected(id.error());
    }
    auto op = require_string(inst, "op", where);
    if (!op) {
        return std::unexpected(op.error());
    }
    auto src = parse_location(inst);

    const auto resolve_table = [&tables](const nlohmann::json& ref)
        -> std::optional<std::vector<std::string>> {
        if (ref.is_array()) {
            std::vector<std::string> names;
            for (const auto& name : ref) {
                if (!name.is_string()) {
                    return std::nullopt;
                }
                names.push_back(name.get<std::string>());
            }
            return names;
        }
        if (ref.is_string()) {
            if (auto it = tables.find(ref.get<std::string>()); it != tables.end()) {
                return it->second;
            }
        }
        return std::nullopt;
    };

    if (*op == "call" || *op == "invoke") {
        const auto callee = inst.find("callee");
        if (callee == inst.end() || !callee->is_string() || callee->get_ref<const std::string&>().empty()) {
            return record_gap(function, *id, fmt::format("{} with malformed callee operand", *op), src);
        }
        function.calls.push_back(ir::CallInst{.id = *id,
                                              .kind = ir::CallKind::kDirect,
                                              .callee = callee->get<std::string>(),
                                              .signature = {},
                                              .candidates = std::nullopt,
                                              .src = std::move(src)});
        return {};
    }

    if (*op == "call.indirect" || *op == "invoke.indirect" || *op == "vcall") {
        ir::CallInst call{.id = *id,
                          .kind = ir::CallKind::kIndirect,
                          .callee = {},
                          .signature = {},
                          .candidates = std::nullopt,
                          .src = src};
        if (inst.contains("signature")) {
            auto signature = parse_signature(inst.at("signature"));
            if (!signature) {
                return record_gap(function, *id, fmt::format("{} with malformed signature", *op), src);
            }
            call.signature = std::move(*signature);
        }
        if (inst.contains("candidates")) {
            call.candidates = resolve_table(inst.at("candidates"));
            if (!call.candidates) {
                return record_gap(
                    function, *id, fmt::format("{} with unknown candidate set", *op), src);
            }
        } else if (*op == "vcall" || !inst.contains("signature")) {
            return record_gap(
                function, *id, fmt::format("{} without signature or candidates", *op), src);
        }
        function.calls.push_back(std::move(call));
        return {};
    }

    if (*op == "fn.addr") {
        const auto target = inst.find("target");
        if (target == inst.end() || !target->is_string()) {
            return record_gap(function, *id, "fn.addr with malformed target operand", src);
        }
        m_address_refs.push_back(target->get<std::string>());
        return {};
    }

    if (*op == "asm") {
        return record_gap(function, *id, "inline assembly", src);
    }

    if (is_opaque_op(*op)) {
        return {};
    }
    return record_gap(function, *id, fmt::format("unknown instruction op '{}'", *op), src);
}

capslock::Result<ir::Function>
ModuleParser::parse_function(const nlohmann::json& fn, const std::string& default_unit, std::size_t index)
{
    const std::string where = fmt::format("functions[{}]", index);
    if (!fn.is_object()) {
        return std::unexpected(malformed(m_source, where, "function must be an object"));
    }

    ir::Function function;
    auto symbol = require_string(fn, "symbol", where);
    if (!symbol) {
        return std::unexpected(symbol.error());
    }
    function.symbol = std::move(*symbol);

    auto display_name = optional_string(fn, "display_name", where, function.symbol);
    auto unit = optional_string(fn, "unit", where, default_unit);
    auto external = optional_bool(fn, "external", where);
    auto entry = optional_bool(fn, "entry", where);
    auto address_taken = optional_bool(fn, "address_taken", where);
    for (const auto* check : {&display_name, &unit}) {
        if (!*check) {
            return std::unexpected(check->error());
        }
    }
    for (const auto* check : {&external, &entry, &address_taken}) {
        if (!*check) {
            return std::unexpected(check->error());
        }
    }
    function.display_name = std::move(*display_name);
    function.unit = std::move(*unit);
    function.external = *external;
    function.entry = *entry;
    function.address_taken = *address_taken;
    function.src = parse_location(fn);

    if (fn.contains("signature")) {
        auto signature = parse_signature(fn.at("signature"));
        if (!signature) {
            return std::unexpected(malformed(m_source, where, "malformed 'signature'"));
        }
        function.signature = std::move(*signature);
    } else {
        function.signature.return_type = "void";
    }

    const auto blocks = fn.find("blocks");
    if (blocks == fn.end()) {
        return function;
    }
    if (!blocks->is_array()) {
        return std::unexpected(malformed(m_source, where, "'blocks' must be an array"));
    }
    if (function.external && !blocks->empty()) {
        return std::unexpected(malformed(m_source, where, "external function has a body"));
    }

    auto tables = parse_candidate_tables(fn, where);
    if (!tables) {
        return std::unexpected(tables.error());
    }

    std::set<std::string> block_ids;
    for (std::size_t b = 0; b < blocks->size(); ++b) {
        const auto& block = (*blocks)[b];
        const std::string block_where = fmt::format("{}.blocks[{}]", where, b);
        if (!block.is_object()) {
            return std::unexpected(malformed(m_source, block_where, "block must be an object"));
        }
        auto block_id = require_string(block, "id", block_where);
        if (!block_id) {
            return std::unexpected(block_id.error());
        }
        if (!block_ids.insert(*block_id).second) {
            return std::unexpected(
                malformed(m_source, block_where, fmt::format("duplicate block id {}", *block_id)));
        }
        const auto insts = block.find("insts");
        if (insts == block.end() || !insts->is_array()) {
            return std::unexpected(malformed(m_source, block_where, "'insts' must be an array"));
        }
        for (std::size_t i = 0; i < insts->size(); ++i) {
            const std::string inst_where = fmt::format("{}.insts[{}]", block_where, i);
            if (auto result = parse_instruction((*insts)[i], function, *tables, inst_where); !result) {
                return std::unexpected(result.error());
            }
        }
    }
    return function;
}

capslock::Result<ir::Module> ModuleParser::parse(const nlohmann::json& doc)
{
    if (!doc.is_object()) {
        return std::unexpected(malformed(m_source, "$", "document must be an object"));
    }
    auto schema_version = require_string(doc, "schema_version", "$");
    if (!schema_version) {
        return std::unexpected(schema_version.error());
    }
    if (*schema_version != kIrSchemaVersion) {
        return std::unexpected(malformed(
            m_source, "$", fmt::format("unsupported schema_version '{}'", *schema_version)));
    }

    if (!m_options.schema_dir.empty()) {
        const auto schema_path = m_options.schema_dir / "cir.v1.schema.json";
        if (auto valid = common::validate_json(doc, schema_path.string()); !valid) {
            if (valid.error().code != "SchemaValidationFailed") {
                return std::unexpected(Error::make(error_code::kConfigurationError,
                                                   valid.error().message));
            }
            return std::unexpected(malformed(m_source, "$", valid.error().message));
        }
    }

    ir::Module module;
    module.schema_version = std::move(*schema_version);
    auto module_id = require_string(doc, "module_id", "$");
    if (!module_id) {
        return std::unexpected(module_id.error());
    }
    module.module_id = std::move(*module_id);
    auto unit = optional_string(doc, "unit", "$", module.module_id);
    if (!unit) {
        return std::unexpected(unit.error());
    }
    module.unit = std::move(*unit);
    auto source_path = optional_string(doc, "source_path", "$", std::string(m_source));
    if (!source_path) {
        return std::unexpected(source_path.error());
    }
    module.source_path = common::normalize_path(*source_path);

    const auto functions = doc.find("functions");
    if (functions == doc.end() || !functions->is_array()) {
        return std::unexpected(malformed(m_source, "$", "'functions' must be an array"));
    }
    std::set<std::string> symbols;
    for (std::size_t i = 0; i < functions->size(); ++i) {
        auto function = parse_function((*functions)[i], module.unit, i);
        if (!function) {
            return std::unexpected(function.error());
        }
        if (!symbols.insert(function->symbol).second) {
            return std::unexpected(
                malformed(m_source,
                          fmt::format("functions[{}]", i),
                          fmt::format("duplicate symbol {}", function->symbol)));
        }
        module.functions.push_back(std::move(*function));
    }

    if (const auto globals = doc.find("globals"); globals != doc.end()) {
        if (!globals->is_array()) {
            return std::unexpected(malformed(m_source, "$", "'globals' must be an array"));
        }
        for (std::size_t i = 0; i < globals->size(); ++i) {
            const auto& raw = (*globals)[i];
            const std::string where = fmt::format("globals[{}]", i);
            if (!raw.is_object()) {
                return std::unexpected(malformed(m_source, where, "global must be an object"));
            }
            auto symbol = require_string(raw, "symbol", where);
            if (!symbol) {
                return std::unexpected(symbol.error());
            }
            ir::GlobalValue global{.symbol = std::move(*symbol), .refs = {}};
            if (raw.contains("refs")) {
                if (!raw.at("refs").is_array()) {
                    return std::unexpected(malformed(m_source, where, "'refs' must be an array"));
                }
                for (const auto& ref : raw.at("refs")) {
                    if (!ref.is_string()) {
                        return std::unexpected(malformed(m_source, where, "non-string ref"));
                    }
                    global.refs.push_back(ref.get<std::string>());
                }
            }
            module.globals.push_back(std::move(global));
        }
    }

    std::ranges::sort(m_address_refs);
    auto [first, last] = std::ranges::unique(m_address_refs);
    m_address_refs.erase(first, last);
    module.address_refs = std::move(m_address_refs);
    return module;
}

[[nodiscard]] capslock::Result<std::string> read_file_bytes(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error::make(error_code::kMalformedInput,
                                           "Failed to open IR artifact: " + path.string()));
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::unexpected(Error::make(error_code::kMalformedInput,
                                           "Failed to read IR artifact: " + path.string()));
    }
    return bytes;
}

}  // namespace

capslock::Result<ir::Module>
parse_module(const nlohmann::json& doc, std::string_view source, const LoadOptions& options)
{
    ModuleParser parser(source, options);
    auto module = parser.parse(doc);
    if (!module) {
        return module;
    }
    auto digest = canonical::hash_canonical(doc);
    if (!digest) {
        return std::unexpected(malformed(source, "$", digest.error().message));
    }
    module->input_digest = std::move(*digest);
    return module;
}

bool is_llvm_artifact(const std::filesystem::path& path)
{
    const auto ext = path.extension().string();
    return ext == ".bc" || ext == ".ll";
}

bool llvm_frontend_available()
{
#if defined(CAPSLOCK_HAS_LLVM_FRONTEND)
    return true;
#else
    return false;
#endif
}

capslock::Result<ir::Module> load_module(const std::filesystem::path& path, const LoadOptions& options)
{
    if (is_llvm_artifact(path)) {
#if defined(CAPSLOCK_HAS_LLVM_FRONTEND)
        frontend_llvm::FrontendLlvm frontend(frontend_llvm::FrontendOptions{.strict = options.strict});
        return frontend.load(path);
#else
        return std::unexpected(Error::make(
            error_code::kMalformedInput,
            fmt::format("{}: LLVM artifacts need the LLVM frontend, which is not built", path.string())));
#endif
    }

    auto bytes = read_file_bytes(path);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(*bytes);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(Error::make(
            error_code::kMalformedInput, fmt::format("{}: not valid JSON: {}", path.string(), ex.what())));
    }

    auto module = parse_module(doc, path.string(), options);
    if (!module) {
        return module;
    }
    CAPSLOCK_LOG_DEBUG(kLoader,
                       "loaded {} as module {} ({} functions)",
                       path.string(),
                       module->module_id,
                       module->functions.size());
    return module;
}

capslock::Result<ir::Program> load_program(const std::vector<std::filesystem::path>& paths,
                                           const LoadOptions& options)
{
    ir::Program program;
    program.modules.reserve(paths.size());
    for (const auto& path : paths) {
        auto module = load_module(path, options);
        if (!module) {
            return std::unexpected(module.error());
        }
        program.modules.push_back(std::move(*module));
    }

    std::ranges::stable_sort(program.modules, {}, &ir::Module::module_id);
    const auto dup = std::ranges::adjacent_find(program.modules, {}, &ir::Module::module_id);
    if (dup != program.modules.end()) {
        return std::unexpected(Error::make(
            error_code::kMalformedInput, fmt::format("module {} loaded twice", dup->module_id)));
    }
    CAPSLOCK_LOG_INFO(kLoader, "loaded {} modules", program.modules.size());
    return program;
}

}  // namespace capslock::loader
