// ============================================================
// Error 実装
// ============================================================

#include "error.hpp"

#include "diagnostics/catalog.hpp"

#include <fmt/format.h>

namespace chew {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TokenizerStuck:
            return "TokenizerStuck";
        case ErrorKind::UnclosedVerbatim:
            return "UnclosedVerbatim";
        case ErrorKind::DocumentMarkerMissing:
            return "DocumentMarkerMissing";
        case ErrorKind::MismatchedClosingConstruct:
            return "MismatchedClosingConstruct";
        case ErrorKind::TrailingContentAfterDocumentBegin:
            return "TrailingContentAfterDocumentBegin";
        case ErrorKind::AnchorNotAtLineStart:
            return "AnchorNotAtLineStart";
        case ErrorKind::InvalidSelectorSyntax:
            return "InvalidSelectorSyntax";
        case ErrorKind::NestingTooDeep:
            return "NestingTooDeep";
    }
    return "Unknown";
}

Error Error::tokenizer_stuck(Position pos, std::string context) {
    return Error{ErrorKind::TokenizerStuck, pos, std::move(context), "", std::nullopt};
}

Error Error::unclosed_verbatim(std::string env_name, Position pos) {
    return Error{ErrorKind::UnclosedVerbatim, pos, std::move(env_name), "", std::nullopt};
}

Error Error::document_marker_missing() {
    return Error{ErrorKind::DocumentMarkerMissing, Position{}, "", "", std::nullopt};
}

Error Error::mismatched_closing(std::string open_construct, Position open_pos, std::string token,
                                Position token_pos) {
    return Error{ErrorKind::MismatchedClosingConstruct, token_pos, std::move(token),
                 std::move(open_construct), open_pos};
}

Error Error::trailing_content(Position pos, std::string text) {
    return Error{ErrorKind::TrailingContentAfterDocumentBegin, pos, std::move(text), "",
                 std::nullopt};
}

Error Error::anchor_not_at_line_start(Position pos, std::string anchor) {
    return Error{ErrorKind::AnchorNotAtLineStart, pos, std::move(anchor), "", std::nullopt};
}

Error Error::invalid_selector(std::string selector) {
    return Error{ErrorKind::InvalidSelectorSyntax, Position{}, std::move(selector), "",
                 std::nullopt};
}

Error Error::nesting_too_deep(size_t limit, Position pos) {
    return Error{ErrorKind::NestingTooDeep, pos, std::to_string(limit), "", std::nullopt};
}

std::string Error::message() const {
    const auto* def = diagnostics::DiagnosticCatalog::instance().get(kind);
    if (!def)
        return fmt::format("{}: {}", error_kind_to_string(kind), subject);

    std::vector<std::string> args;
    switch (kind) {
        case ErrorKind::TokenizerStuck:
            args = {std::to_string(position.offset), subject};
            break;
        case ErrorKind::UnclosedVerbatim:
            args = {subject, std::to_string(position.offset)};
            break;
        case ErrorKind::MismatchedClosingConstruct: {
            std::string where =
                related ? fmt::format("{}:{}", related->line + 1, related->column + 1) : "?";
            args = {subject, detail, where};
            break;
        }
        case ErrorKind::AnchorNotAtLineStart:
            args = {subject, std::to_string(position.line + 1),
                    std::to_string(position.column + 1)};
            break;
        case ErrorKind::DocumentMarkerMissing:
            break;
        case ErrorKind::TrailingContentAfterDocumentBegin:
        case ErrorKind::InvalidSelectorSyntax:
        case ErrorKind::NestingTooDeep:
            args = {subject};
            break;
    }
    return diagnostics::format_message(def->message_template, args);
}

}  // namespace chew
