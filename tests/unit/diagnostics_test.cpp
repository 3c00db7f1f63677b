#include "../../src/diagnostics/engine.hpp"
#include "../../src/frontend/parser/parser.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace chew;
using namespace chew::diagnostics;

class DiagnosticsTest : public ::testing::Test {
   protected:
    DiagnosticEngine engine_;
};

// カタログ
TEST_F(DiagnosticsTest, EveryErrorKindHasDefinition) {
    for (ErrorKind kind :
         {ErrorKind::TokenizerStuck, ErrorKind::UnclosedVerbatim, ErrorKind::DocumentMarkerMissing,
          ErrorKind::MismatchedClosingConstruct, ErrorKind::TrailingContentAfterDocumentBegin,
          ErrorKind::AnchorNotAtLineStart, ErrorKind::InvalidSelectorSyntax,
          ErrorKind::NestingTooDeep}) {
        const auto* def = DiagnosticCatalog::instance().get(kind);
        ASSERT_NE(def, nullptr) << error_kind_to_string(kind);
        EXPECT_EQ(def->kind, kind);
        EXPECT_EQ(DiagnosticCatalog::instance().get(def->id), def);
    }
}

TEST_F(DiagnosticsTest, FormatMessage) {
    EXPECT_EQ(format_message("{0} and {1}, {0}", {"a", "b"}), "a and b, a");
    EXPECT_EQ(format_message("\\begin{document} not found", {}), "\\begin{document} not found");
}

// メッセージ
TEST_F(DiagnosticsTest, ErrorMessages) {
    Position pos = Position{}.advance("abc\nde");
    EXPECT_EQ(Error::tokenizer_stuck(pos, "'\\\\'").message(), "lexer jammed @ 6, looking at '\\\\'");
    EXPECT_EQ(Error::unclosed_verbatim("verbatim", pos).message(),
              "unclosed 'verbatim' environment @ 6");
    EXPECT_EQ(Error::invalid_selector("bogus").message(), "invalid selector bogus");
    EXPECT_EQ(Error::anchor_not_at_line_start(pos, "CNAME '\\\\x'").message(),
              "anchor CNAME '\\\\x' not in column 0 (2:3)");
    EXPECT_EQ(Error::nesting_too_deep(8, pos).message(), "constructs nested deeper than 8 levels");
}

// 表示
TEST_F(DiagnosticsTest, PrintMismatchWithNote) {
    std::string text = "\\begin{document}\n\\begin{a}\\end{b}\\end{document}";
    auto result = Parser(text).parse_document();
    ASSERT_FALSE(result.ok());

    engine_.report(result.error());
    ASSERT_EQ(engine_.count(), 2u);
    EXPECT_TRUE(engine_.has_errors());
    EXPECT_EQ(engine_.diagnostics()[0].id, "E011");
    EXPECT_EQ(engine_.diagnostics()[1].level, DiagnosticLevel::Note);

    std::ostringstream out;
    engine_.print(Source(text, "doc.tex"), out);
    EXPECT_EQ(out.str(),
              "doc.tex:2:10: error[E011]: wrong closing construct ENVEND 'b' for ENVBEGIN 'a' "
              "opened at 2:1\n"
              "    \\begin{a}\\end{b}\\end{document}\n"
              "             ^\n"
              "doc.tex:2:1: note[E011]: ENVBEGIN 'a' opened here\n"
              "    \\begin{a}\\end{b}\\end{document}\n"
              "    ^\n");
}

TEST_F(DiagnosticsTest, ClearResets) {
    engine_.report(Error::document_marker_missing());
    EXPECT_EQ(engine_.count(), 1u);
    engine_.clear();
    EXPECT_EQ(engine_.count(), 0u);
    EXPECT_FALSE(engine_.has_errors());
}
