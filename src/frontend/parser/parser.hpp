#pragma once

#include "common/result.hpp"
#include "frontend/lexer/lexer.hpp"
#include "frontend/tree/syntax_tree.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chew {

/// 構文木構築の設定
struct ParserConfig {
    size_t max_nesting_depth = 100000;  // 同時に開いていられる構造の最大数
};

/// 文書の開始マーカー
inline constexpr std::string_view kDocumentBegin = "\\begin{document}";

/// open_kind/open_text で開いた構造を candidate が閉じるか
bool closes(TokenKind open_kind, const std::string& open_text, const Token& candidate);

// ============================================================
// 構造の構築（再帰下降を明示的スタックで実行）
// ============================================================
class TreeBuilder {
   public:
    TreeBuilder(Lexer& lexer, SyntaxTree& tree, ParserConfig config = ParserConfig{})
        : lexer_(lexer), tree_(tree), config_(config) {}

    /// opener で開いた構造を、それが閉じるまで構築して parent の子に追加する
    ///
    /// 閉じトークンを消費した後、字句解析器をそれ以上進めない。
    Result<NodeId> build(NodeId parent, const Token& opener);

   private:
    /// 開いている構造1つ分
    struct Frame {
        NodeId node;
        TokenKind opener;
        std::string text;
    };

    Error mismatch(const Frame& top, const Token& offending) const;

    Lexer& lexer_;
    SyntaxTree& tree_;
    ParserConfig config_;
    std::vector<Frame> stack_;
};

// ============================================================
// 文書パーサ（プリアンブル / 本体 / ポストアンブル）
// ============================================================
class Parser {
   public:
    explicit Parser(std::string_view source, LexerConfig lexer_config = LexerConfig{},
                    ParserConfig config = ParserConfig{})
        : source_(source), lexer_config_(std::move(lexer_config)), config_(config) {}

    /// 文書全体を解析して File を根とする構文木を返す
    Result<SyntaxTree> parse_document() const;

   private:
    std::string_view source_;
    LexerConfig lexer_config_;
    ParserConfig config_;
};

}  // namespace chew
