#pragma once

#include "common/result.hpp"
#include "token.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chew {

/// 字句解析の設定（構築時に明示的に渡す）
struct LexerConfig {
    std::vector<std::string> verbatim_environments = {"verbatim", "Verbatim", "semiverbatim"};
    bool capture_verbatim = true;  // falseならverbatim環境も通常の規則で解析

    /// nameがverbatim扱いか（取り込みが無効ならfalse）
    bool is_verbatim(std::string_view name) const;
};

/// 字句解析器
///
/// 1トークンずつ要求に応じて生成する。保持する状態は次に走査する位置と、
/// 直前にverbatim環境の開始を返したかどうかだけ。
class Lexer {
   public:
    Lexer(std::string_view source, Position start = Position{}, LexerConfig config = LexerConfig{});

    /// 現在位置から次のトークンを生成し、位置を進める
    ///
    /// 入力の終端では EndOfInput を何度でも返す。
    Result<Token> next();

    /// EndOfInputまで（それを含めて）すべてのトークンを生成
    Result<std::vector<Token>> tokenize();

    /// 次に走査する位置
    Position cursor() const { return cursor_; }

    const LexerConfig& config() const { return config_; }

   private:
    Result<Token> scan_verbatim(const std::string& name);
    Result<Token> scan_regular();

    std::optional<Token> scan_environment(std::string_view rest, std::string_view keyword,
                                          TokenKind kind) const;
    Result<Token> scan_command(std::string_view rest) const;
    Result<Token> scan_comment(std::string_view rest) const;
    Token scan_text(std::string_view rest) const;

    /// 現在位置からspelling分を消費するトークンを作る
    Token make_token(TokenKind kind, std::string text, std::string_view spelling) const;

    /// エラー表示用の残り入力の抜粋
    std::string excerpt() const;

    bool is_at_end() const { return cursor_.byte >= source_.size(); }

    static bool is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

    std::string_view source_;
    Position cursor_;
    LexerConfig config_;
    std::optional<std::string> pending_verbatim_;  // 次に取り込むverbatim環境名
};

}  // namespace chew
