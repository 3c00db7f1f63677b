#pragma once

// ============================================================
// 診断カタログ - 全エラー定義を一元管理
// ============================================================

#include "common/error.hpp"
#include "levels.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace chew {
namespace diagnostics {

/// 診断定義
struct DiagnosticDefinition {
    std::string id;    // "E001"
    std::string name;  // "tokenizer-stuck"
    ErrorKind kind;
    DiagnosticLevel default_level;
    std::string message_template;  // "unclosed '{0}' environment"
    DetectionStage stage;

    DiagnosticDefinition() = default;
    DiagnosticDefinition(std::string id_, std::string name_, ErrorKind kind_,
                         DiagnosticLevel level_, std::string msg_, DetectionStage stage_)
        : id(std::move(id_)),
          name(std::move(name_)),
          kind(kind_),
          default_level(level_),
          message_template(std::move(msg_)),
          stage(stage_) {}
};

/// 診断カタログ - 全定義を一元管理
class DiagnosticCatalog {
   public:
    static DiagnosticCatalog& instance() {
        static DiagnosticCatalog catalog;
        return catalog;
    }

    /// 診断定義を登録
    void register_definition(DiagnosticDefinition def);

    /// IDで定義を取得
    const DiagnosticDefinition* get(const std::string& id) const;

    /// エラー種別で定義を取得
    const DiagnosticDefinition* get(ErrorKind kind) const;

    /// 全定義を取得
    const std::unordered_map<std::string, DiagnosticDefinition>& all() const {
        return definitions_;
    }

   private:
    DiagnosticCatalog() { register_defaults(); }

    void register_defaults();

    std::unordered_map<std::string, DiagnosticDefinition> definitions_;
    std::map<ErrorKind, std::string> ids_by_kind_;
};

/// メッセージテンプレートをフォーマット（{0}, {1}, ... を置換）
std::string format_message(const std::string& tmpl, const std::vector<std::string>& args);

}  // namespace diagnostics
}  // namespace chew
