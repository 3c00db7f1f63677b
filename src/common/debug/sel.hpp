#pragma once

#include "../debug.hpp"

#include <string>

namespace chew::debug::sel {

/// セレクタ・チャンク メッセージID
enum class Id {
    Compile,
    Invalid,
    Match,
    Selected,
    ChunkStart,
    Boundary,
    ChunkEnd,
    NotAtLineStart,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Compiling selector", "セレクタをコンパイル"},
    {"Invalid selector", "不正なセレクタ"},
    {"Anchor matched", "アンカーに一致"},
    {"Anchors selected", "アンカーを選択"},
    {"Computing chunk boundaries", "チャンク境界を計算"},
    {"Boundary", "境界"},
    {"Chunks emitted", "チャンクを出力"},
    {"Anchor not at line start", "アンカーが行頭にありません"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::chew::debug::g_lang];
}

/// Select段階のログ
inline void log(Id id, const std::string& detail,
                ::chew::debug::Level level = ::chew::debug::Level::Debug) {
    if (!::chew::debug::enabled(level))
        return;
    ::chew::debug::log(::chew::debug::Stage::Select, level, std::string(get(id)) + ": " + detail);
}

/// Chunk段階のログ
inline void log_chunk(Id id, const std::string& detail,
                      ::chew::debug::Level level = ::chew::debug::Level::Debug) {
    if (!::chew::debug::enabled(level))
        return;
    ::chew::debug::log(::chew::debug::Stage::Chunk, level, std::string(get(id)) + ": " + detail);
}

}  // namespace chew::debug::sel
