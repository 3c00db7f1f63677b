#include "node.hpp"

namespace chew {

const char* node_kind_to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::CommandName:
            return "CNAME";
        case NodeKind::Comment:
            return "COMMENT";
        case NodeKind::PlainText:
            return "TEXT";
        case NodeKind::VerbatimBlock:
            return "VERB";
        case NodeKind::Env:
            return "ENV";
        case NodeKind::DisplayMath:
            return "DMATH";
        case NodeKind::InlineMath:
            return "TMATH";
        case NodeKind::Group:
            return "GROUP";
        case NodeKind::File:
            return "FILE";
        case NodeKind::Preamble:
            return "PREAMBLE";
        case NodeKind::Postamble:
            return "POSTAMBLE";
        case NodeKind::End:
            return "END";
    }
    return "UNKNOWN";
}

bool is_construct(NodeKind kind) {
    switch (kind) {
        case NodeKind::Env:
        case NodeKind::DisplayMath:
        case NodeKind::InlineMath:
        case NodeKind::Group:
            return true;
        default:
            return false;
    }
}

std::optional<NodeKind> node_kind_for_token(TokenKind kind) {
    switch (kind) {
        case TokenKind::EnvBegin:
            return NodeKind::Env;
        case TokenKind::DisplayMathBegin:
        case TokenKind::DoubleDollar:
            return NodeKind::DisplayMath;
        case TokenKind::InlineMathBegin:
        case TokenKind::Dollar:
            return NodeKind::InlineMath;
        case TokenKind::GroupBegin:
            return NodeKind::Group;
        case TokenKind::CommandName:
            return NodeKind::CommandName;
        case TokenKind::Comment:
            return NodeKind::Comment;
        case TokenKind::PlainText:
            return NodeKind::PlainText;
        case TokenKind::VerbatimBlock:
            return NodeKind::VerbatimBlock;
        default:
            return std::nullopt;
    }
}

}  // namespace chew
