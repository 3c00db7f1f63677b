// ============================================================
// 設定システム - 実装
// ============================================================

#include "config.hpp"

#include "common/debug/cfg.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace chew {
namespace config {

bool ConfigLoader::load(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        error_ = "cannot open " + filepath;
        debug::cfg::log(debug::cfg::Id::NotFound, filepath, debug::Level::Warn);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str(), filepath);
}

bool ConfigLoader::load_from_string(const std::string& content, const std::string& origin) {
    environments_.reset();
    capture_.reset();
    max_depth_.reset();
    error_.clear();
    loaded_ = false;

    if (!parse_yaml(content)) {
        error_ = origin + ":" + error_;
        return false;
    }
    config_path_ = origin;
    loaded_ = true;
    debug::cfg::log(debug::cfg::Id::Loaded, origin);
    return true;
}

bool ConfigLoader::find_and_load(const std::string& start_path) {
    fs::path current = fs::absolute(start_path);

    // 最大10レベルまで親ディレクトリを探索
    for (int i = 0; i < 10; ++i) {
        fs::path config_file = current / kConfigFileName;
        debug::cfg::log(debug::cfg::Id::Search, config_file.string(), debug::Level::Trace);
        if (fs::exists(config_file)) {
            return load(config_file.string());
        }

        // 親ディレクトリへ
        fs::path parent = current.parent_path();
        if (parent == current) {
            break;  // ルートに到達
        }
        current = parent;
    }

    return false;
}

LexerConfig ConfigLoader::lexer_config() const {
    LexerConfig config;
    if (environments_)
        config.verbatim_environments = *environments_;
    if (capture_)
        config.capture_verbatim = *capture_;
    return config;
}

ParserConfig ConfigLoader::parser_config() const {
    ParserConfig config;
    if (max_depth_)
        config.max_nesting_depth = *max_depth_;
    return config;
}

bool ConfigLoader::parse_yaml(const std::string& content) {
    // 簡易YAMLパーサー
    // サポート形式:
    // verbatim:
    //   capture: true
    //   environments:
    //     - verbatim
    //     - lstlisting
    // parser:
    //   max_depth: 4096

    enum class Section { None, Verbatim, Parser, Other };

    std::istringstream stream(content);
    std::string line;
    size_t line_num = 0;

    Section section = Section::None;
    bool in_environments = false;

    while (std::getline(stream, line)) {
        line_num++;

        // コメント行をスキップ
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        // インデントレベルを計算
        size_t indent = 0;
        for (char c : line) {
            if (c == ' ')
                indent++;
            else if (c == '\t')
                indent += 2;  // タブは2スペースとして扱う
            else
                break;
        }

        // セクション判定
        if (indent == 0) {
            if (trimmed == "verbatim:")
                section = Section::Verbatim;
            else if (trimmed == "parser:")
                section = Section::Parser;
            else
                section = Section::Other;  // 未知のセクションは無視
            in_environments = false;
            continue;
        }

        if (section == Section::Verbatim && in_environments && indent >= 4 &&
            trimmed[0] == '-') {
            std::string name = trim(trimmed.substr(1));
            if (name.empty())
                return fail(line_num, "empty environment name");
            environments_->push_back(name);
            debug::cfg::log(debug::cfg::Id::VerbatimEnv, name, debug::Level::Trace);
            continue;
        }

        if (section == Section::None || section == Section::Other)
            continue;

        size_t colon_pos = trimmed.find(':');
        if (colon_pos == std::string::npos)
            return fail(line_num, "expected 'key: value'");
        std::string key = trim(trimmed.substr(0, colon_pos));
        std::string value = trim(trimmed.substr(colon_pos + 1));
        in_environments = false;

        if (section == Section::Verbatim) {
            if (key == "capture") {
                capture_ = parse_bool(value);
                if (!capture_)
                    return fail(line_num, "capture must be true or false");
                debug::cfg::log(debug::cfg::Id::Capture, value);
            } else if (key == "environments") {
                if (!value.empty())
                    return fail(line_num, "environments must be a list");
                // リストを書いた時点で既定の一覧を置き換える
                environments_ = std::vector<std::string>{};
                in_environments = true;
            } else {
                return fail(line_num, "unknown key '" + key + "'");
            }
        } else if (section == Section::Parser) {
            if (key != "max_depth")
                return fail(line_num, "unknown key '" + key + "'");
            if (value.empty() || value.size() > 18 ||
                value.find_first_not_of("0123456789") != std::string::npos)
                return fail(line_num, "max_depth must be a positive integer");
            size_t depth = std::stoull(value);
            if (depth == 0)
                return fail(line_num, "max_depth must be a positive integer");
            max_depth_ = depth;
            debug::cfg::log(debug::cfg::Id::MaxDepth, value);
        }
    }

    return true;  // 空の設定も有効
}

bool ConfigLoader::fail(size_t line_num, const std::string& what) {
    error_ = std::to_string(line_num) + ": " + what;
    debug::cfg::log(debug::cfg::Id::Invalid, error_, debug::Level::Error);
    return false;
}

std::optional<bool> ConfigLoader::parse_bool(const std::string& str) {
    if (str == "true" || str == "yes" || str == "on")
        return true;
    if (str == "false" || str == "no" || str == "off")
        return false;
    return std::nullopt;
}

std::string ConfigLoader::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

}  // namespace config
}  // namespace chew
