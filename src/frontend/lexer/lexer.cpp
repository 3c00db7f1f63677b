// レキサー実装（トークン化、スキャン）
#include "lexer.hpp"

#include "common/debug/lex.hpp"
#include "common/quote.hpp"
#include "common/utf8.hpp"

#include <algorithm>

namespace chew {

namespace {

// PlainTextを終わらせる文字
constexpr std::string_view kReserved = "\\{}$%";

// 抜粋の長さ（スカラ値）
constexpr size_t kExcerptLength = 16;

}  // namespace

bool LexerConfig::is_verbatim(std::string_view name) const {
    if (!capture_verbatim)
        return false;
    return std::find(verbatim_environments.begin(), verbatim_environments.end(), name) !=
           verbatim_environments.end();
}

Lexer::Lexer(std::string_view source, Position start, LexerConfig config)
    : source_(source), cursor_(start), config_(std::move(config)) {}

Result<Token> Lexer::next() {
    // verbatim環境の直後は通常の規則を使わない
    if (pending_verbatim_) {
        std::string name = std::move(*pending_verbatim_);
        pending_verbatim_.reset();
        return scan_verbatim(name);
    }

    if (is_at_end()) {
        debug::lex::log(debug::lex::Id::EndOfInput, debug::Level::Trace);
        return Result<Token>::Success(Token(TokenKind::EndOfInput, "", cursor_, cursor_));
    }

    auto result = scan_regular();
    if (!result)
        return result;

    const Token& tok = result.value();
    if (tok.kind == TokenKind::EnvBegin && config_.is_verbatim(tok.text)) {
        pending_verbatim_ = tok.text;
    }
    cursor_ = tok.end;

    if (debug::enabled(debug::Level::Trace)) {
        debug::lex::dump_token(token_kind_to_string(tok.kind), tok.text,
                               static_cast<int>(tok.start.line + 1),
                               static_cast<int>(tok.start.column + 1));
    }
    return result;
}

Result<std::vector<Token>> Lexer::tokenize() {
    debug::lex::log(debug::lex::Id::Start);
    debug::lex::log(debug::lex::Id::SourceLength, std::to_string(source_.size()));

    std::vector<Token> tokens;
    while (true) {
        auto tok = next();
        if (!tok)
            return Result<std::vector<Token>>::Failure(tok.error());
        bool done = tok.value().kind == TokenKind::EndOfInput;
        tokens.push_back(std::move(tok).value());
        if (done)
            break;
    }

    debug::lex::log(debug::lex::Id::End, std::to_string(tokens.size()) + " tokens");
    return Result<std::vector<Token>>::Success(std::move(tokens));
}

Result<Token> Lexer::scan_verbatim(const std::string& name) {
    std::string closer = "\\end{" + name + "}";
    size_t found = source_.find(closer, cursor_.byte);
    if (found == std::string_view::npos) {
        debug::lex::log(debug::lex::Id::UnclosedVerbatim, name, debug::Level::Error);
        return Result<Token>::Failure(Error::unclosed_verbatim(name, cursor_));
    }

    std::string_view body = source_.substr(cursor_.byte, found - cursor_.byte);
    debug::lex::log(debug::lex::Id::VerbatimCapture,
                    name + " (" + std::to_string(utf8::length(body)) + " chars)");
    Token tok = make_token(TokenKind::VerbatimBlock, std::string(body), body);
    cursor_ = tok.end;
    return Result<Token>::Success(std::move(tok));
}

Result<Token> Lexer::scan_regular() {
    std::string_view rest = source_.substr(cursor_.byte);
    char c = rest[0];

    switch (c) {
        case '\\': {
            if (auto tok = scan_environment(rest, "\\begin{", TokenKind::EnvBegin))
                return Result<Token>::Success(std::move(*tok));
            if (auto tok = scan_environment(rest, "\\end{", TokenKind::EnvEnd))
                return Result<Token>::Success(std::move(*tok));
            if (rest.size() >= 2) {
                TokenKind kind;
                switch (rest[1]) {
                    case '[':
                        kind = TokenKind::DisplayMathBegin;
                        break;
                    case ']':
                        kind = TokenKind::DisplayMathEnd;
                        break;
                    case '(':
                        kind = TokenKind::InlineMathBegin;
                        break;
                    case ')':
                        kind = TokenKind::InlineMathEnd;
                        break;
                    default:
                        return scan_command(rest);
                }
                std::string_view spelling = rest.substr(0, 2);
                debug::lex::log(debug::lex::Id::Delimiter, std::string(spelling),
                                debug::Level::Trace);
                return Result<Token>::Success(make_token(kind, std::string(spelling), spelling));
            }
            return scan_command(rest);
        }
        case '{':
            return Result<Token>::Success(make_token(TokenKind::GroupBegin, "{", rest.substr(0, 1)));
        case '}':
            return Result<Token>::Success(make_token(TokenKind::GroupEnd, "}", rest.substr(0, 1)));
        case '$':
            if (rest.size() >= 2 && rest[1] == '$')
                return Result<Token>::Success(
                    make_token(TokenKind::DoubleDollar, "$$", rest.substr(0, 2)));
            return Result<Token>::Success(make_token(TokenKind::Dollar, "$", rest.substr(0, 1)));
        case '%':
            return scan_comment(rest);
        default:
            return Result<Token>::Success(scan_text(rest));
    }
}

std::optional<Token> Lexer::scan_environment(std::string_view rest, std::string_view keyword,
                                             TokenKind kind) const {
    if (rest.substr(0, keyword.size()) != keyword)
        return std::nullopt;

    // 環境名: [A-Za-z]+\*?
    size_t i = keyword.size();
    size_t name_start = i;
    while (i < rest.size() && is_alpha(rest[i]))
        ++i;
    if (i == name_start)
        return std::nullopt;
    if (i < rest.size() && rest[i] == '*')
        ++i;
    if (i >= rest.size() || rest[i] != '}')
        return std::nullopt;

    std::string name(rest.substr(name_start, i - name_start));
    debug::lex::log(kind == TokenKind::EnvBegin ? debug::lex::Id::EnvBegin : debug::lex::Id::EnvEnd,
                    name, debug::Level::Trace);
    return make_token(kind, std::move(name), rest.substr(0, i + 1));
}

Result<Token> Lexer::scan_command(std::string_view rest) const {
    if (rest.size() < 2) {
        debug::lex::log(debug::lex::Id::Stuck, std::to_string(cursor_.offset), debug::Level::Error);
        return Result<Token>::Failure(Error::tokenizer_stuck(cursor_, excerpt()));
    }

    size_t len;
    if (is_alpha(rest[1])) {
        len = 2;
        while (len < rest.size() && is_alpha(rest[len]))
            ++len;
    } else {
        // バックスラッシュ + 任意の1スカラ値
        len = 1 + std::min(utf8::sequence_length(static_cast<unsigned char>(rest[1])),
                           rest.size() - 1);
    }

    std::string_view spelling = rest.substr(0, len);
    debug::lex::log(debug::lex::Id::Command, std::string(spelling), debug::Level::Trace);
    return Result<Token>::Success(
        make_token(TokenKind::CommandName, std::string(spelling), spelling));
}

Result<Token> Lexer::scan_comment(std::string_view rest) const {
    // コメントは改行まで（改行を含む）。改行がなければ一致しない
    size_t newline = rest.find('\n');
    if (newline == std::string_view::npos) {
        debug::lex::log(debug::lex::Id::Stuck, "comment without newline", debug::Level::Error);
        return Result<Token>::Failure(Error::tokenizer_stuck(cursor_, excerpt()));
    }
    std::string_view spelling = rest.substr(0, newline + 1);
    debug::lex::log(debug::lex::Id::Comment, std::string(spelling), debug::Level::Trace);
    return Result<Token>::Success(make_token(TokenKind::Comment, std::string(spelling), spelling));
}

Token Lexer::scan_text(std::string_view rest) const {
    size_t len = rest.find_first_of(kReserved);
    if (len == std::string_view::npos)
        len = rest.size();
    std::string_view spelling = rest.substr(0, len);
    debug::lex::log(debug::lex::Id::Text, std::to_string(utf8::length(spelling)) + " chars",
                    debug::Level::Trace);
    return make_token(TokenKind::PlainText, std::string(spelling), spelling);
}

Token Lexer::make_token(TokenKind kind, std::string text, std::string_view spelling) const {
    return Token(kind, std::move(text), cursor_, cursor_.advance(spelling));
}

std::string Lexer::excerpt() const {
    std::string_view rest = source_.substr(std::min<size_t>(cursor_.byte, source_.size()));
    return quote_truncated(rest, kExcerptLength);
}

}  // namespace chew
