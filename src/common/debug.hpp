#pragma once

#include <iostream>
#include <optional>
#include <string_view>

namespace chew::debug {

/// デバッグ出力の有無と言語 (0=English, 1=Japanese)
inline bool g_debug_mode = false;
inline int g_lang = 0;

enum class Level { Trace, Debug, Info, Warn, Error };

inline Level g_debug_level = Level::Debug;

/// 処理段階（ログの接頭辞になる）
enum class Stage { Lexer, Parser, Select, Chunk, Config, Cli };

inline constexpr const char* kStageNames[] = {"LEXER", "PARSER", "SELECT",
                                              "CHUNK", "CONFIG", "CLI"};

/// level の出力が有効か
inline bool enabled(Level level) {
    return g_debug_mode && level >= g_debug_level;
}

/// [STAGE] 形式で標準エラーに1行出力する
inline void log(Stage stage, Level level, std::string_view msg) {
    if (!enabled(level))
        return;
    std::cerr << "[" << kStageNames[static_cast<int>(stage)] << "] ";
    if (level == Level::Error)
        std::cerr << "ERROR: ";
    else if (level == Level::Warn)
        std::cerr << "WARN: ";
    std::cerr << msg << std::endl;
}

inline void set_debug_mode(bool enabled) {
    g_debug_mode = enabled;
}
inline void set_lang(int lang) {
    g_lang = lang;
}
inline void set_level(Level level) {
    g_debug_level = level;
}

/// -d=<level> の値を解釈する。未知の名前なら nullopt
inline std::optional<Level> parse_level(std::string_view s) {
    constexpr std::string_view names[] = {"trace", "debug", "info", "warn", "error"};
    for (int i = 0; i < 5; ++i) {
        if (s == names[i])
            return static_cast<Level>(i);
    }
    return std::nullopt;
}

}  // namespace chew::debug
