#pragma once

// ============================================================
// 診断レベル定義
// ============================================================

namespace chew {
namespace diagnostics {

/// 診断レベル
enum class DiagnosticLevel {
    Error = 0,  // 処理を中断する
    Note = 1,   // エラーの補足情報（開いた構造の位置など）
};

/// 検出段階
enum class DetectionStage {
    Lexer,     // 字句解析
    Parser,    // 構文木の構築
    Document,  // 文書の分割
    Select,    // セレクタ
    Chunk,     // チャンク境界の計算
};

/// レベルを文字列に変換
inline const char* level_to_string(DiagnosticLevel level) {
    switch (level) {
        case DiagnosticLevel::Error:
            return "error";
        case DiagnosticLevel::Note:
            return "note";
        default:
            return "unknown";
    }
}

/// レベルに対応するANSI色コード
inline const char* level_to_color(DiagnosticLevel level) {
    switch (level) {
        case DiagnosticLevel::Error:
            return "\033[31m";  // 赤
        case DiagnosticLevel::Note:
            return "\033[36m";  // シアン
        default:
            return "\033[0m";
    }
}

}  // namespace diagnostics
}  // namespace chew
