// ============================================================
// DiagnosticCatalog 実装
// ============================================================

#include "catalog.hpp"

#include "definitions/errors.hpp"

namespace chew {
namespace diagnostics {

std::string format_message(const std::string& tmpl, const std::vector<std::string>& args) {
    std::string result = tmpl;
    for (size_t i = 0; i < args.size(); ++i) {
        std::string placeholder = "{" + std::to_string(i) + "}";
        size_t pos = 0;
        while ((pos = result.find(placeholder, pos)) != std::string::npos) {
            result.replace(pos, placeholder.length(), args[i]);
            pos += args[i].length();
        }
    }
    return result;
}

void DiagnosticCatalog::register_definition(DiagnosticDefinition def) {
    ids_by_kind_[def.kind] = def.id;
    definitions_[def.id] = std::move(def);
}

const DiagnosticDefinition* DiagnosticCatalog::get(const std::string& id) const {
    auto it = definitions_.find(id);
    return it != definitions_.end() ? &it->second : nullptr;
}

const DiagnosticDefinition* DiagnosticCatalog::get(ErrorKind kind) const {
    auto it = ids_by_kind_.find(kind);
    if (it == ids_by_kind_.end())
        return nullptr;
    return get(it->second);
}

void DiagnosticCatalog::register_defaults() {
    definitions::register_errors(*this);
}

}  // namespace diagnostics
}  // namespace chew
