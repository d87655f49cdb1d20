/**
 * @file frontend.cpp
 * @brief LLVM frontend: maps an llvm::Module onto the CIR model
 */

#include "frontend_llvm/frontend.hpp"

#include "capslock/logging.hpp"
#include "capslock/version.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <optional>
#include <set>
#include <vector>

#include <fmt/format.h>
#include <llvm/Demangle/Demangle.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/DebugInfoMetadata.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/GlobalVariable.h>
#include <llvm/IR/InstrTypes.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Metadata.h>
#include <llvm/IR/Module.h>
#include <llvm/IRReader/IRReader.h>
#include <llvm/Support/SourceMgr.h>
#include <llvm/Support/raw_ostream.h>

namespace capslock::frontend_llvm {

namespace {

[[nodiscard]] std::string type_name(const llvm::Type* type)
{
    std::string text;
    llvm::raw_string_ostream os(text);
    type->print(os);
    return os.str();
}

[[nodiscard]] ir::Signature signature_of(const llvm::FunctionType* type)
{
    ir::Signature signature;
    signature.return_type = type_name(type->getReturnType());
    for (const llvm::Type* param : type->params()) {
        signature.params.push_back(type_name(param));
    }
    signature.variadic = type->isVarArg();
    return signature;
}

[[nodiscard]] std::optional<ir::Location> location_of(const llvm::Instruction& inst)
{
    const llvm::DILocation* loc = inst.getDebugLoc().get();
    if (loc == nullptr) {
        return std::nullopt;
    }
    return ir::Location{
        .file = common::join_source_path(loc->getDirectory().str(), loc->getFilename().str()),
        .line = static_cast<int>(loc->getLine()),
        .col = static_cast<int>(loc->getColumn())};
}

[[nodiscard]] std::optional<ir::Location> location_of(const llvm::Function& function)
{
    const llvm::DISubprogram* subprogram = function.getSubprogram();
    if (subprogram == nullptr) {
        return std::nullopt;
    }
    return ir::Location{
        .file = common::join_source_path(subprogram->getDirectory().str(),
                                         subprogram->getFilename().str()),
        .line = static_cast<int>(subprogram->getLine()),
        .col = 0};
}

/// Functions reachable through a global initializer's constant operands.
[[nodiscard]] std::vector<std::string> referenced_functions(const llvm::Constant* init)
{
    std::set<std::string> names;
    std::set<const llvm::Constant*> seen;
    std::vector<const llvm::Constant*> worklist{init};
    while (!worklist.empty()) {
        const llvm::Constant* current = worklist.back();
        worklist.pop_back();
        if (!seen.insert(current).second) {
            continue;
        }
        if (const auto* function = llvm::dyn_cast<llvm::Function>(current)) {
            if (!function->isIntrinsic()) {
                names.insert(function->getName().str());
            }
            continue;
        }
        if (llvm::isa<llvm::GlobalValue>(current)) {
            continue;
        }
        for (const llvm::Use& operand : current->operands()) {
            if (const auto* constant = llvm::dyn_cast<llvm::Constant>(operand.get())) {
                worklist.push_back(constant);
            }
        }
    }
    return {names.begin(), names.end()};
}

class ModuleBuilder
{
public:
    ModuleBuilder(const FrontendOptions& options, std::string source)
        : m_options(options)
        , m_source(std::move(source))
    {}

    [[nodiscard]] capslock::Result<ir::Function> build_function(const llvm::Function& function,
                                                                const std::string& module_unit)
    {
        ir::Function result;
        result.symbol = function.getName().str();
        result.display_name = demangle_symbol(result.symbol);
        result.unit = unit_from_display_name(result.display_name, module_unit);
        result.external = function.isDeclaration();
        result.entry = !result.external && function.hasExternalLinkage();
        result.address_taken = function.hasAddressTaken();
        result.signature = signature_of(function.getFunctionType());
        result.src = location_of(function);

        std::size_t block_index = 0;
        for (const llvm::BasicBlock& block : function) {
            std::size_t inst_index = 0;
            for (const llvm::Instruction& inst : block) {
                const std::string site_id = fmt::format("B{}.I{}", block_index, inst_index++);
                const auto* call = llvm::dyn_cast<llvm::CallBase>(&inst);
                if (call == nullptr) {
                    continue;
                }
                if (auto status = add_call(*call, site_id, result); !status) {
                    return std::unexpected(status.error());
                }
            }
            ++block_index;
        }
        return result;
    }

private:
    capslock::VoidResult add_call(const llvm::CallBase& call, const std::string& site_id, ir::Function& caller)
    {
        auto src = location_of(call);
        if (call.isInlineAsm()) {
            return record_gap(caller, site_id, "inline assembly", std::move(src));
        }
        const llvm::Value* called = call.getCalledOperand();
        if (called == nullptr) {
            return record_gap(caller, site_id, "call without callee operand", std::move(src));
        }
        const llvm::Value* stripped = called->stripPointerCastsAndAliases();
        if (const auto* callee = llvm::dyn_cast<llvm::Function>(stripped)) {
            if (callee->isIntrinsic()) {
                return {};
            }
            caller.calls.push_back(ir::CallInst{.id = site_id,
                                                .kind = ir::CallKind::kDirect,
                                                .callee = callee->getName().str(),
                                                .signature = {},
                                                .candidates = std::nullopt,
                                                .src = std::move(src)});
            return {};
        }
        if (llvm::isa<llvm::Constant>(stripped) && !llvm::isa<llvm::GlobalVariable>(stripped)) {
            return record_gap(caller, site_id, "call through a non-function constant", std::move(src));
        }

        ir::CallInst indirect{.id = site_id,
                              .kind = ir::CallKind::kIndirect,
                              .callee = {},
                              .signature = signature_of(call.getFunctionType()),
                              .candidates = std::nullopt,
                              .src = std::move(src)};
        if (const llvm::MDNode* md = call.getMetadata(llvm::LLVMContext::MD_callees)) {
            std::vector<std::string> candidates;
            for (const llvm::MDOperand& op : md->operands()) {
                if (const auto* callee = llvm::mdconst::dyn_extract_or_null<llvm::Function>(op)) {
                    candidates.push_back(callee->getName().str());
                }
            }
            indirect.candidates = std::move(candidates);
        }
        caller.calls.push_back(std::move(indirect));
        return {};
    }

    capslock::VoidResult record_gap(ir::Function& caller,
                                    const std::string& site_id,
                                    std::string detail,
                                    std::optional<ir::Location> src)
    {
        if (m_options.strict) {
            return std::unexpected(Error::make(
                error_code::kUnsupportedConstruct,
                fmt::format("{}: {} at {}: {}", m_source, caller.symbol, site_id, detail)));
        }
        CAPSLOCK_LOG_WARN(kLoader, "{}: {} in {} at {}", m_source, detail, caller.symbol, site_id);
        caller.gaps.push_back(ir::Gap{.site_id = site_id,
                                      .code = error_code::kUnsupportedConstruct,
                                      .detail = std::move(detail),
                                      .src = std::move(src)});
        return {};
    }

    const FrontendOptions& m_options;
    std::string m_source;
};

[[nodiscard]] bool is_legacy_hash(std::string_view component)
{
    if (component.size() != 17 || component.front() != 'h') {
        return false;
    }
    for (char c : component.substr(1)) {
        if (std::isxdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string demangle_symbol(const std::string& symbol)
{
    std::string demangled;
    if (symbol.starts_with("_R")) {
        int status = 0;
        char* buffer = llvm::rustDemangle(symbol.c_str(), nullptr, nullptr, &status);
        if (buffer != nullptr) {
            demangled = buffer;
            std::free(buffer);
        }
    }
    if (demangled.empty()) {
        demangled = llvm::demangle(symbol);
    }
    const auto last = demangled.rfind("::");
    if (last != std::string::npos && is_legacy_hash(std::string_view(demangled).substr(last + 2))) {
        demangled.erase(last);
    }
    return demangled;
}

std::string unit_from_display_name(std::string_view display_name, std::string_view fallback)
{
    std::string_view name = display_name;
    while (!name.empty() && (name.front() == '<' || name.front() == '&' || name.front() == '*')) {
        name.remove_prefix(1);
    }
    constexpr std::string_view kDyn = "dyn ";
    if (name.starts_with(kDyn)) {
        name.remove_prefix(kDyn.size());
    }
    const auto sep = name.find("::");
    if (sep == std::string_view::npos || sep == 0) {
        return std::string(fallback);
    }
    const std::string_view head = name.substr(0, sep);
    if (head.find_first_of(" <>(),") != std::string_view::npos) {
        return std::string(fallback);
    }
    return std::string(head);
}

FrontendLlvm::FrontendLlvm(FrontendOptions options)
    : m_options(std::move(options))
{}

capslock::Result<ir::Module> FrontendLlvm::load(const std::filesystem::path& path) const
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error::make(error_code::kMalformedInput,
                                           "Failed to open IR artifact: " + path.string()));
    }
    const std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    llvm::LLVMContext context;
    llvm::SMDiagnostic diagnostic;
    std::unique_ptr<llvm::Module> llvm_module = llvm::parseIRFile(path.string(), diagnostic, context);
    if (!llvm_module) {
        return std::unexpected(Error::make(
            error_code::kMalformedInput,
            fmt::format("{}: {}", path.string(), diagnostic.getMessage().str())));
    }

    ir::Module module;
    module.schema_version = kIrSchemaVersion;
    module.module_id = path.filename().string();
    module.unit = m_options.unit.empty() ? path.stem().string() : m_options.unit;
    module.source_path = common::normalize_path(
        llvm_module->getSourceFileName().empty() ? path.string() : llvm_module->getSourceFileName());
    module.input_digest = common::sha256_prefixed(bytes);

    ModuleBuilder builder(m_options, path.string());
    for (const llvm::Function& function : *llvm_module) {
        if (function.isIntrinsic()) {
            continue;
        }
        auto built = builder.build_function(function, module.unit);
        if (!built) {
            return std::unexpected(built.error());
        }
        module.functions.push_back(std::move(*built));
    }

    for (const llvm::GlobalVariable& global : llvm_module->globals()) {
        if (!global.hasInitializer()) {
            continue;
        }
        auto refs = referenced_functions(global.getInitializer());
        if (!refs.empty()) {
            module.globals.push_back(
                ir::GlobalValue{.symbol = global.getName().str(), .refs = std::move(refs)});
        }
    }

    CAPSLOCK_LOG_DEBUG(kLoader,
                       "LLVM frontend loaded {} ({} functions, {} globals with function refs)",
                       path.string(),
                       module.functions.size(),
                       module.globals.size());
    return module;
}

}  // namespace capslock::frontend_llvm
