#pragma once

#include "../debug.hpp"

#include <string>

namespace chew::debug::lex {

/// Lexer メッセージID
enum class Id {
    Start,
    End,
    SourceLength,
    EnvBegin,
    EnvEnd,
    Delimiter,
    Command,
    Comment,
    Text,
    VerbatimCapture,
    EndOfInput,
    Stuck,
    UnclosedVerbatim,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Starting lexical analysis", "字句解析を開始"},
    {"Completed lexical analysis", "字句解析を完了"},
    {"Source length", "ソースの長さ"},
    {"Environment begin", "環境の開始"},
    {"Environment end", "環境の終了"},
    {"Delimiter detected", "区切りを検出"},
    {"Command name detected", "コマンド名を検出"},
    {"Comment detected", "コメントを検出"},
    {"Plain text detected", "テキストを検出"},
    {"Capturing verbatim body", "verbatim本体を取り込み"},
    {"End of input", "入力の終端"},
    {"Lexer jammed", "字句解析が進めません"},
    {"Unclosed verbatim environment", "verbatim環境が閉じられていません"},
};

/// メッセージ取得
inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::chew::debug::g_lang];
}

/// ログ出力
inline void log(Id id, ::chew::debug::Level level = ::chew::debug::Level::Debug) {
    if (!::chew::debug::enabled(level))
        return;
    ::chew::debug::log(::chew::debug::Stage::Lexer, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::chew::debug::Level level = ::chew::debug::Level::Debug) {
    if (!::chew::debug::enabled(level))
        return;
    ::chew::debug::log(::chew::debug::Stage::Lexer, level, std::string(get(id)) + ": " + detail);
}

/// トークン情報をダンプ（Traceレベル）
inline void dump_token(const std::string& type, const std::string& value, int line = -1,
                       int col = -1) {
    if (!::chew::debug::enabled(::chew::debug::Level::Trace))
        return;
    std::string msg = "Token[" + type + "] = \"" + value + "\"";
    if (line >= 0 && col >= 0) {
        msg += " @ " + std::to_string(line) + ":" + std::to_string(col);
    }
    ::chew::debug::log(::chew::debug::Stage::Lexer, ::chew::debug::Level::Trace, msg);
}

}  // namespace chew::debug::lex
