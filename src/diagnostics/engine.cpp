// ============================================================
// DiagnosticEngine 実装
// ============================================================

#include "engine.hpp"

#include <algorithm>

namespace chew {
namespace diagnostics {

void DiagnosticEngine::report(const Error& error) {
    const auto* def = DiagnosticCatalog::instance().get(error.kind);
    std::string id = def ? def->id : "E000";
    std::string name = def ? def->name : error_kind_to_string(error.kind);
    DiagnosticLevel level = def ? def->default_level : DiagnosticLevel::Error;

    diagnostics_.emplace_back(id, name, level, error.position, error.message());

    // 対応する開き構造の位置を補足
    if (error.related) {
        diagnostics_.emplace_back(id, name, DiagnosticLevel::Note, *error.related,
                                  error.detail + " opened here");
    }
}

bool DiagnosticEngine::has_errors() const {
    return std::any_of(diagnostics_.begin(), diagnostics_.end(),
                       [](const auto& d) { return d.level == DiagnosticLevel::Error; });
}

void DiagnosticEngine::print(const Source& source, std::ostream& out) const {
    const char* reset = color_ ? "\033[0m" : "";
    const char* bold = color_ ? "\033[1m" : "";

    for (const auto& diag : diagnostics_) {
        uint32_t line = diag.position.line + 1;
        uint32_t column = diag.position.column + 1;

        // ファイル:行:列
        out << bold << source.filename() << ":" << line << ":" << column << ": " << reset;

        // 重大度とルールID
        const char* color = color_ ? level_to_color(diag.level) : "";
        out << bold << color << level_to_string(diag.level) << reset << "[" << diag.id << "]: ";
        out << diag.message << "\n";

        // ソース行を表示
        auto text = source.get_line(line);
        if (text.empty())
            continue;
        out << "    " << text << "\n";

        // キャレット
        out << "    ";
        for (uint32_t i = 1; i < column; ++i) {
            out << ' ';
        }
        out << bold << color << "^" << reset << "\n";
    }
}

}  // namespace diagnostics
}  // namespace chew
