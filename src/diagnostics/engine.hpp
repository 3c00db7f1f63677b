#pragma once

// ============================================================
// 診断エンジン - エラーの報告と出力
// ============================================================

#include "catalog.hpp"
#include "common/error.hpp"
#include "common/source.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace chew {
namespace diagnostics {

/// 診断インスタンス
struct Diagnostic {
    std::string id;
    std::string name;
    DiagnosticLevel level;
    Position position;
    std::string message;

    Diagnostic() = default;
    Diagnostic(std::string id_, std::string name_, DiagnosticLevel level_, Position position_,
               std::string msg_)
        : id(std::move(id_)),
          name(std::move(name_)),
          level(level_),
          position(position_),
          message(std::move(msg_)) {}
};

/// 診断エンジン - 診断の報告と表示を管理
class DiagnosticEngine {
   public:
    DiagnosticEngine() {
        // カタログの初期化を確実に行う
        (void)DiagnosticCatalog::instance();
    }

    /// エラー値を報告（関連位置があればノートも追加）
    void report(const Error& error);

    /// エラーがあるかチェック
    bool has_errors() const;

    /// 診断数を取得
    size_t count() const { return diagnostics_.size(); }

    /// 診断を取得
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    /// ANSI色付けの有無
    void set_color(bool enabled) { color_ = enabled; }

    /// 結果を表示
    void print(const Source& source, std::ostream& out = std::cerr) const;

    /// 診断をクリア
    void clear() { diagnostics_.clear(); }

   private:
    std::vector<Diagnostic> diagnostics_;
    bool color_ = false;
};

}  // namespace diagnostics
}  // namespace chew
