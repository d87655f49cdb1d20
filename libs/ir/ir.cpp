/**
 * @file ir.cpp
 * @brief CIR helpers: signature keys and JSON serialization
 */

#include "capslock/ir.hpp"

namespace capslock::ir {

std::string Signature::key() const
{
    std::string key = "fn(";
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (i != 0) {
            key += ',';
        }
        key += params[i];
    }
    if (variadic) {
        key += params.empty() ? "..." : ",...";
    }
    key += ")->";
    key += return_type;
    return key;
}

void to_json(nlohmann::json& j, const Location& loc)
{
    j = nlohmann::json{
        {"file", loc.file},
        {"line", loc.line},
        { "col",  loc.col}
    };
}

void to_json(nlohmann::json& j, const Signature& signature)
{
    j = nlohmann::json{
        {"return_type", signature.return_type},
        {     "params",      signature.params},
        {   "variadic",    signature.variadic}
    };
}

void to_json(nlohmann::json& j, const Gap& gap)
{
    j = nlohmann::json{
        {"site_id", gap.site_id},
        {   "code",    gap.code},
        { "detail",  gap.detail}
    };
    if (gap.src.has_value()) {
        j["src"] = *gap.src;
    }
}

}  // namespace capslock::ir
