#pragma once

#include "../debug.hpp"

#include <string>

namespace chew::debug::cfg {

/// Config メッセージID
enum class Id {
    Search,
    Loaded,
    NotFound,
    VerbatimEnv,
    Capture,
    MaxDepth,
    Invalid,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Searching config file", "設定ファイルを探索"},
    {"Config loaded", "設定を読み込み"},
    {"Config file not found", "設定ファイルが見つかりません"},
    {"Verbatim environment", "verbatim環境"},
    {"Verbatim capture", "verbatimの取り込み"},
    {"Maximum nesting depth", "最大入れ子深さ"},
    {"Invalid config entry", "不正な設定項目"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::chew::debug::g_lang];
}

inline void log(Id id, const std::string& detail,
                ::chew::debug::Level level = ::chew::debug::Level::Debug) {
    if (!::chew::debug::enabled(level))
        return;
    ::chew::debug::log(::chew::debug::Stage::Config, level, std::string(get(id)) + ": " + detail);
}

}  // namespace chew::debug::cfg
