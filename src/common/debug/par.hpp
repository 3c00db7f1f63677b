#pragma once

#include "../debug.hpp"

#include <string>

namespace chew::debug::par {

/// Parser メッセージID
enum class Id {
    Start,
    End,
    DocumentFound,
    Preamble,
    Postamble,
    Open,
    Close,
    Leaf,
    Depth,
    Error,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Starting tree construction", "構文木の構築を開始"},
    {"Completed tree construction", "構文木の構築を完了"},
    {"Document marker found", "文書マーカーを検出"},
    {"Preamble skipped", "プリアンブルをスキップ"},
    {"Postamble", "ポストアンブル"},
    {"Opening construct", "構造を開く"},
    {"Closing construct", "構造を閉じる"},
    {"Leaf node", "葉ノード"},
    {"Nesting depth", "入れ子の深さ"},
    {"Parse error", "構文解析エラー"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::chew::debug::g_lang];
}

inline void log(Id id, ::chew::debug::Level level = ::chew::debug::Level::Debug) {
    if (!::chew::debug::enabled(level))
        return;
    ::chew::debug::log(::chew::debug::Stage::Parser, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::chew::debug::Level level = ::chew::debug::Level::Debug) {
    if (!::chew::debug::enabled(level))
        return;
    ::chew::debug::log(::chew::debug::Stage::Parser, level, std::string(get(id)) + ": " + detail);
}

}  // namespace chew::debug::par
