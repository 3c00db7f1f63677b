// 構造（環境・数式・グループ）の構築
#include "common/debug/par.hpp"
#include "common/quote.hpp"
#include "parser.hpp"

#include <fmt/format.h>

namespace chew {

bool closes(TokenKind open_kind, const std::string& open_text, const Token& candidate) {
    switch (open_kind) {
        case TokenKind::EnvBegin:
            return candidate.kind == TokenKind::EnvEnd && candidate.text == open_text;
        case TokenKind::DisplayMathBegin:
            return candidate.kind == TokenKind::DisplayMathEnd;
        case TokenKind::InlineMathBegin:
            return candidate.kind == TokenKind::InlineMathEnd;
        case TokenKind::GroupBegin:
            return candidate.kind == TokenKind::GroupEnd;
        case TokenKind::DoubleDollar:
            return candidate.kind == TokenKind::DoubleDollar;
        case TokenKind::Dollar:
            return candidate.kind == TokenKind::Dollar;
        default:
            return false;
    }
}

Result<NodeId> TreeBuilder::build(NodeId parent, const Token& opener) {
    auto opened_kind = node_kind_for_token(opener.kind);
    if (!opened_kind || !is_opening_kind(opener.kind)) {
        // 構造を開かないトークンからは始められない
        return Result<NodeId>::Failure(
            Error::mismatched_closing(node_kind_to_string(tree_.node(parent).kind),
                                      tree_.node(parent).start,
                                      fmt::format("{} {}", token_kind_to_string(opener.kind),
                                                  quote(opener.text)),
                                      opener.start));
    }

    stack_.clear();
    stack_.push_back(Frame{tree_.add_branch(*opened_kind, opener.text, opener.start), opener.kind,
                           opener.text});
    debug::par::log(debug::par::Id::Open, token_spelling(opener.kind, opener.text),
                    debug::Level::Trace);

    while (true) {
        auto next = lexer_.next();
        if (!next)
            return Result<NodeId>::Failure(next.error());
        Token tok = std::move(next).value();

        // 最内の構造を閉じる
        if (closes(stack_.back().opener, stack_.back().text, tok)) {
            NodeId done = stack_.back().node;
            tree_.append_child(done, tree_.add_leaf(NodeKind::End, tok.text, tok.start));
            stack_.pop_back();
            debug::par::log(debug::par::Id::Close, token_spelling(tok.kind, tok.text),
                            debug::Level::Trace);

            tree_.append_child(stack_.empty() ? parent : stack_.back().node, done);
            if (stack_.empty())
                return Result<NodeId>::Success(done);
            continue;
        }

        if (is_opening_kind(tok.kind)) {
            if (stack_.size() >= config_.max_nesting_depth) {
                debug::par::log(debug::par::Id::Depth, std::to_string(stack_.size()),
                                debug::Level::Error);
                return Result<NodeId>::Failure(
                    Error::nesting_too_deep(config_.max_nesting_depth, tok.start));
            }
            NodeId node = tree_.add_branch(*node_kind_for_token(tok.kind), tok.text, tok.start);
            debug::par::log(debug::par::Id::Open, token_spelling(tok.kind, tok.text),
                            debug::Level::Trace);
            stack_.push_back(Frame{node, tok.kind, std::move(tok.text)});
        } else if (is_atom_kind(tok.kind)) {
            NodeId leaf = tree_.add_leaf(*node_kind_for_token(tok.kind), tok.text, tok.start);
            tree_.append_child(stack_.back().node, leaf);
            debug::par::log(debug::par::Id::Leaf, token_kind_to_string(tok.kind),
                            debug::Level::Trace);
        } else {
            // 対応しない閉じトークン、または入力の終端
            return Result<NodeId>::Failure(mismatch(stack_.back(), tok));
        }
    }
}

Error TreeBuilder::mismatch(const Frame& top, const Token& offending) const {
    std::string open = fmt::format("{} {}", token_kind_to_string(top.opener), quote(top.text));
    std::string found =
        fmt::format("{} {}", token_kind_to_string(offending.kind), quote(offending.text));
    debug::par::log(debug::par::Id::Error, found + " closing " + open, debug::Level::Error);
    return Error::mismatched_closing(std::move(open), tree_.node(top.node).start, std::move(found),
                                     offending.start);
}

}  // namespace chew
