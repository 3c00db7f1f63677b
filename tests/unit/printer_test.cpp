#include "../../src/common/quote.hpp"
#include "../../src/frontend/parser/parser.hpp"
#include "../../src/output/printer.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace chew;

class PrinterTest : public ::testing::Test {};

// 文字列の表示形式
TEST_F(PrinterTest, Quote) {
    EXPECT_EQ(quote("abc"), "'abc'");
    EXPECT_EQ(quote(""), "''");
    EXPECT_EQ(quote("a\nb\tc"), "'a\\nb\\tc'");
    EXPECT_EQ(quote("\\section"), "'\\\\section'");
    EXPECT_EQ(quote("it's"), "\"it's\"");
    EXPECT_EQ(quote("it's \"x\""), "'it\\'s \"x\"'");
    EXPECT_EQ(quote("\x01"), "'\\x01'");
    EXPECT_EQ(quote("\xc3\xa9"), "'\xc3\xa9'");
}

TEST_F(PrinterTest, QuoteTruncated) {
    EXPECT_EQ(quote_truncated("short", 32), "'short'");
    EXPECT_EQ(quote_truncated("abcdefgh", 4), "'abcd'[...]");
    EXPECT_EQ(quote_truncated("\xc3\xa9\xc3\xa9\xc3\xa9", 2), "'\xc3\xa9\xc3\xa9'[...]");
}

TEST_F(PrinterTest, ElideMiddle) {
    EXPECT_EQ(elide_middle("0123456789abcdef", 16, 8), "0123456789abcdef");
    EXPECT_EQ(elide_middle("0123456789abcdefg", 16, 8), "01234567[...]9abcdefg");
}

// 各行の形式
TEST_F(PrinterTest, TreeLine) {
    Position pos = Position{}.advance("\\begin{document}\n");
    Node node{NodeKind::CommandName, "\\section", pos, std::nullopt};
    EXPECT_EQ(output::format_tree_line(node, 2), "00017:0002-01:         CNAME: '\\\\section'");
}

TEST_F(PrinterTest, TokenLine) {
    Position pos = Position{}.advance("ab\ncd");
    Token short_tok(TokenKind::PlainText, "hello", pos, pos);
    EXPECT_EQ(output::format_token_line(short_tok), "5 1 2 TEXT : 'hello'");

    Token long_tok(TokenKind::PlainText, "0123456789abcdef", pos, pos);
    EXPECT_EQ(output::format_token_line(long_tok), "5 1 2 TEXT : '0123456789abcdef...'");
}

TEST_F(PrinterTest, AnchorLine) {
    Position pos = Position{}.advance("\\begin{document}\n");
    Node env{NodeKind::Env, "itemize", pos, std::vector<NodeId>{}};
    EXPECT_EQ(output::format_anchor_line(env), "line 2 char 17 kind ENV name 'itemize'");

    Node comment{NodeKind::Comment, "%chunk " + std::string(40, 'x') + "\n", pos, std::nullopt};
    EXPECT_EQ(output::format_anchor_line(comment),
              "line 2 char 17 kind COMMENT name '%chunk " + std::string(25, 'x') + "'[...]");
}

TEST_F(PrinterTest, ChunkLine) {
    EXPECT_EQ(output::format_chunk_line(select::Chunk{2, 3, 17, 17}), "lines 2 3 chars 17 17");
}

// 構文木全体の表示
TEST_F(PrinterTest, PrintTree) {
    auto result = Parser("\\begin{document}\n{x}\n\\end{document}").parse_document();
    ASSERT_TRUE(result.ok());
    std::ostringstream out;
    output::print_tree(result.value(), out);
    EXPECT_EQ(out.str(),
              "00035:0003-15: FILE: ''\n"
              "00000:0001-01:     PREAMBLE: ''\n"
              "00000:0001-01:     ENV: 'document'\n"
              "00016:0001-17:         TEXT: '\\n'\n"
              "00017:0002-01:         GROUP: '{'\n"
              "00018:0002-02:             TEXT: 'x'\n"
              "00019:0002-03:             END: '}'\n"
              "00020:0002-04:         TEXT: '\\n'\n"
              "00021:0003-01:         END: 'document'\n"
              "00035:0003-15:     POSTAMBLE: ''\n");
}

TEST_F(PrinterTest, PrintTokensSkipsEndOfInput) {
    std::string source = "a{b}";
    Lexer lexer(source);
    auto tokens = lexer.tokenize();
    ASSERT_TRUE(tokens.ok());
    std::ostringstream out;
    output::print_tokens(tokens.value(), out);
    EXPECT_EQ(out.str(),
              "0 0 0 TEXT : 'a'\n"
              "1 0 1 GROUPBEGIN : '{'\n"
              "2 0 2 TEXT : 'b'\n"
              "3 0 3 GROUPEND : '}'\n");
}

TEST_F(PrinterTest, PrintList) {
    std::ostringstream out;
    output::print_list({"\\label{a}", "\\label{b}"}, out);
    EXPECT_EQ(out.str(), "\\label{a}\n\\label{b}\n");
}
