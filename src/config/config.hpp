// ============================================================
// 設定システム
// ============================================================
// .chew.yml から字句解析・構文解析の設定を読み込む

#pragma once

#include "frontend/lexer/lexer.hpp"
#include "frontend/parser/parser.hpp"

#include <optional>
#include <string>
#include <vector>

namespace chew {
namespace config {

/// 設定ファイル名
inline constexpr const char* kConfigFileName = ".chew.yml";

// 設定ローダー
class ConfigLoader {
   public:
    // 設定ファイルを読み込み（失敗時は error() に理由）
    bool load(const std::string& filepath);

    // 文字列から読み込み
    bool load_from_string(const std::string& content, const std::string& origin = "<string>");

    // .chew.yml を探す（カレントディレクトリから親に向かって）
    bool find_and_load(const std::string& start_path = ".");

    // 設定が読み込まれているか
    bool is_loaded() const { return loaded_; }

    // 設定ファイルのパスを取得
    const std::string& config_path() const { return config_path_; }

    // 最後のエラー
    const std::string& error() const { return error_; }

    // 読み込んだ値を反映した字句解析の設定
    LexerConfig lexer_config() const;

    // 読み込んだ値を反映した構文解析の設定
    ParserConfig parser_config() const;

   private:
    // 簡易YAMLパーサー（key: value と - item のみ）
    bool parse_yaml(const std::string& content);

    bool fail(size_t line_num, const std::string& what);

    // 真偽値を解析
    static std::optional<bool> parse_bool(const std::string& str);

    // 行をトリム
    static std::string trim(const std::string& str);

    std::optional<std::vector<std::string>> environments_;
    std::optional<bool> capture_;
    std::optional<size_t> max_depth_;
    std::string config_path_;
    std::string error_;
    bool loaded_ = false;
};

}  // namespace config
}  // namespace chew
