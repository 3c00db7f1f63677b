// 文書の分割（プリアンブル / 本体 / ポストアンブル）
#include "common/debug/par.hpp"
#include "parser.hpp"

namespace chew {

Result<SyntaxTree> Parser::parse_document() const {
    debug::par::log(debug::par::Id::Start);

    size_t marker = source_.find(kDocumentBegin);
    if (marker == std::string_view::npos) {
        debug::par::log(debug::par::Id::Error, std::string(kDocumentBegin), debug::Level::Error);
        return Result<SyntaxTree>::Failure(Error::document_marker_missing());
    }

    SyntaxTree tree;
    NodeId file = tree.add_branch(NodeKind::File, "", Position{});
    tree.set_root(file);

    // プリアンブルはトークン化しない
    std::string_view preamble = source_.substr(0, marker);
    tree.append_child(file, tree.add_leaf(NodeKind::Preamble, std::string(preamble), Position{}));
    debug::par::log(debug::par::Id::Preamble, std::to_string(preamble.size()) + " bytes");

    Position body_start = Position{}.advance(preamble);
    debug::par::log(debug::par::Id::DocumentFound,
                    std::to_string(body_start.line + 1) + ":" +
                        std::to_string(body_start.column + 1));

    Lexer lexer(source_, body_start, lexer_config_);
    auto opener = lexer.next();
    if (!opener)
        return Result<SyntaxTree>::Failure(opener.error());

    TreeBuilder builder(lexer, tree, config_);
    auto body = builder.build(file, opener.value());
    if (!body)
        return Result<SyntaxTree>::Failure(body.error());

    // 文書の閉じトークンより後は字句解析器を進めずにそのまま取り出す
    Position post_start = lexer.cursor();
    std::string_view postamble = source_.substr(post_start.byte);
    tree.append_child(file, tree.add_leaf(NodeKind::Postamble, std::string(postamble), post_start));
    debug::par::log(debug::par::Id::Postamble, std::to_string(postamble.size()) + " bytes");

    tree.set_start(file, post_start.advance(postamble));

    debug::par::log(debug::par::Id::End, std::to_string(tree.size()) + " nodes");
    return Result<SyntaxTree>::Success(std::move(tree));
}

}  // namespace chew
