#pragma once

#include "position.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace chew {

/// エラーの種類（すべて処理全体を中断する）
enum class ErrorKind {
    TokenizerStuck,                     // どの規則にも一致しない
    UnclosedVerbatim,                   // verbatim環境が閉じられていない
    DocumentMarkerMissing,              // \begin{document} がない
    MismatchedClosingConstruct,         // 閉じ構造が対応しない
    TrailingContentAfterDocumentBegin,  // \begin{document} の直後が改行でない
    AnchorNotAtLineStart,               // アンカーが行頭にない
    InvalidSelectorSyntax,              // セレクタの構文が不正
    NestingTooDeep,                     // 入れ子が深すぎる
};

/// ErrorKindを文字列に変換
const char* error_kind_to_string(ErrorKind kind);

/// エラー値
///
/// subject/detail の意味は種類ごとに異なる:
///   TokenizerStuck              subject=残り入力の抜粋
///   UnclosedVerbatim            subject=環境名
///   MismatchedClosingConstruct  subject=問題のトークン, detail=開いている構造, related=その位置
///   TrailingContent...          subject=本文先頭のテキスト
///   AnchorNotAtLineStart        subject=アンカーの表示
///   InvalidSelectorSyntax       subject=セレクタ文字列
///   NestingTooDeep              subject=上限値
struct Error {
    ErrorKind kind;
    Position position;
    std::string subject;
    std::string detail;
    std::optional<Position> related;

    static Error tokenizer_stuck(Position pos, std::string context);
    static Error unclosed_verbatim(std::string env_name, Position pos);
    static Error document_marker_missing();
    static Error mismatched_closing(std::string open_construct, Position open_pos,
                                    std::string token, Position token_pos);
    static Error trailing_content(Position pos, std::string text);
    static Error anchor_not_at_line_start(Position pos, std::string anchor);
    static Error invalid_selector(std::string selector);
    static Error nesting_too_deep(size_t limit, Position pos);

    /// 診断カタログのテンプレートからメッセージを生成
    std::string message() const;
};

}  // namespace chew
