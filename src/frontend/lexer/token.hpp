#pragma once

#include "common/position.hpp"

#include <string>

namespace chew {

/// トークンの種類
enum class TokenKind {
    // 構造の開始・終了
    EnvBegin,          // \begin{NAME}
    EnvEnd,            // \end{NAME}
    DisplayMathBegin,  // \[
    DisplayMathEnd,    // \]
    InlineMathBegin,   // \(
    InlineMathEnd,     // \)
    GroupBegin,        // {
    GroupEnd,          // }
    DoubleDollar,      // $$（開始・終了兼用）
    Dollar,            // $（開始・終了兼用）

    // アトム
    CommandName,    // \foo, \\, \%
    Comment,        // %...\n
    PlainText,      // [^\\{}$%]+
    VerbatimBlock,  // verbatim環境の本体

    // 特殊
    EndOfInput,
};

/// トークン
///
/// text は EnvBegin/EnvEnd では環境名のみ、VerbatimBlock では本体、
/// それ以外では一致したテキストそのもの。
struct Token {
    TokenKind kind;
    std::string text;
    Position start;  // 開始位置
    Position end;    // 綴り全体の直後の位置

    Token(TokenKind k, std::string t, Position s, Position e)
        : kind(k), text(std::move(t)), start(s), end(e) {}
};

/// TokenKindを文字列に変換
const char* token_kind_to_string(TokenKind kind);

/// 構造を開くトークンか（$ と $$ を含む）
bool is_opening_kind(TokenKind kind);

/// 葉ノードになるトークンか
bool is_atom_kind(TokenKind kind);

/// トークンの綴り（EnvBegin/EnvEnd は \begin{...} / \end{...} に戻す）
std::string token_spelling(TokenKind kind, const std::string& text);

}  // namespace chew
