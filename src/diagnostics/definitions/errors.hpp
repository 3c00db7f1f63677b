#pragma once

// ============================================================
// 診断定義 - エラー (E001-E099)
// ============================================================

#include "../catalog.hpp"

namespace chew {
namespace diagnostics {
namespace definitions {

/// エラー定義を登録
inline void register_errors(DiagnosticCatalog& catalog) {
    using DL = DiagnosticLevel;
    using DS = DetectionStage;
    using EK = ErrorKind;

    // E001-E009: 字句解析
    catalog.register_definition({"E001", "tokenizer-stuck", EK::TokenizerStuck, DL::Error,
                                 "lexer jammed @ {0}, looking at {1}", DS::Lexer});

    catalog.register_definition({"E002", "unclosed-verbatim", EK::UnclosedVerbatim, DL::Error,
                                 "unclosed '{0}' environment @ {1}", DS::Lexer});

    // E010-E019: 構文木
    catalog.register_definition({"E010", "document-marker-missing", EK::DocumentMarkerMissing,
                                 DL::Error, "\\begin{document} not found", DS::Document});

    catalog.register_definition({"E011", "wrong-closing-construct",
                                 EK::MismatchedClosingConstruct, DL::Error,
                                 "wrong closing construct {0} for {1} opened at {2}", DS::Parser});

    catalog.register_definition({"E012", "nesting-too-deep", EK::NestingTooDeep, DL::Error,
                                 "constructs nested deeper than {0} levels", DS::Parser});

    // E020-E029: セレクタとチャンク
    catalog.register_definition({"E020", "invalid-selector", EK::InvalidSelectorSyntax,
                                 DL::Error, "invalid selector {0}", DS::Select});

    catalog.register_definition({"E021", "trailing-content", EK::TrailingContentAfterDocumentBegin,
                                 DL::Error, "trailing garbage after \\begin{document}: {0}",
                                 DS::Chunk});

    catalog.register_definition({"E022", "anchor-not-at-line-start", EK::AnchorNotAtLineStart,
                                 DL::Error, "anchor {0} not in column 0 ({1}:{2})", DS::Chunk});
}

}  // namespace definitions
}  // namespace diagnostics
}  // namespace chew
