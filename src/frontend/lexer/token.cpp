#include "token.hpp"

namespace chew {

const char* token_kind_to_string(TokenKind kind) {
    switch (kind) {
        case TokenKind::EnvBegin:
            return "ENVBEGIN";
        case TokenKind::EnvEnd:
            return "ENVEND";
        case TokenKind::DisplayMathBegin:
            return "DMATHBEGIN";
        case TokenKind::DisplayMathEnd:
            return "DMATHEND";
        case TokenKind::InlineMathBegin:
            return "TMATHBEGIN";
        case TokenKind::InlineMathEnd:
            return "TMATHEND";
        case TokenKind::GroupBegin:
            return "GROUPBEGIN";
        case TokenKind::GroupEnd:
            return "GROUPEND";
        case TokenKind::DoubleDollar:
            return "DOLDOL";
        case TokenKind::Dollar:
            return "DOL";
        case TokenKind::CommandName:
            return "CNAME";
        case TokenKind::Comment:
            return "COMMENT";
        case TokenKind::PlainText:
            return "TEXT";
        case TokenKind::VerbatimBlock:
            return "VERB";
        case TokenKind::EndOfInput:
            return "EOF";
    }
    return "UNKNOWN";
}

bool is_opening_kind(TokenKind kind) {
    switch (kind) {
        case TokenKind::EnvBegin:
        case TokenKind::DisplayMathBegin:
        case TokenKind::InlineMathBegin:
        case TokenKind::GroupBegin:
        case TokenKind::DoubleDollar:
        case TokenKind::Dollar:
            return true;
        default:
            return false;
    }
}

bool is_atom_kind(TokenKind kind) {
    switch (kind) {
        case TokenKind::CommandName:
        case TokenKind::Comment:
        case TokenKind::PlainText:
        case TokenKind::VerbatimBlock:
            return true;
        default:
            return false;
    }
}

std::string token_spelling(TokenKind kind, const std::string& text) {
    switch (kind) {
        case TokenKind::EnvBegin:
            return "\\begin{" + text + "}";
        case TokenKind::EnvEnd:
            return "\\end{" + text + "}";
        default:
            return text;
    }
}

}  // namespace chew
