#include "../../src/frontend/parser/parser.hpp"
#include "../../src/select/chunker.hpp"
#include "../../src/select/selector.hpp"

#include <gtest/gtest.h>

using namespace chew;
using select::Chunk;

class ChunkerTest : public ::testing::Test {
   protected:
    // 文書を解析し、セレクタで選んだアンカーからチャンクを求める
    Result<std::vector<Chunk>> chunks(const std::string& source,
                                      const std::vector<std::string>& selectors) {
        auto parsed = Parser(source).parse_document();
        EXPECT_TRUE(parsed.ok());
        if (!parsed.ok())
            return Result<std::vector<Chunk>>::Failure(parsed.error());
        tree_ = std::move(parsed).value();

        auto compiled = select::compile_all(selectors);
        EXPECT_TRUE(compiled.ok());
        if (!compiled.ok())
            return Result<std::vector<Chunk>>::Failure(compiled.error());
        auto anchors = select::select(tree_, tree_.body_children(), compiled.value());
        return select::compute_chunks(tree_, anchors);
    }

    SyntaxTree tree_;
};

// 2つの節
TEST_F(ChunkerTest, ScenarioTwoSections) {
    auto result =
        chunks("\\begin{document}\n\\section{A}\ntext\n\\section{B}\n\\end{document}", {"m:section"});
    ASSERT_TRUE(result.ok());
    const auto& list = result.value();
    ASSERT_EQ(list.size(), 3u);

    // 本体の先頭から最初のアンカーまで（空）
    EXPECT_EQ(list[0], (Chunk{2, 1, 17, 0}));
    EXPECT_EQ(list[1], (Chunk{2, 3, 17, 17}));
    EXPECT_EQ(list[2], (Chunk{4, 4, 34, 12}));
}

TEST_F(ChunkerTest, NoAnchorsGivesWholeBody) {
    auto result = chunks("\\begin{document}\nline one\nline two\n\\end{document}\n", {"\\section"});
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0], (Chunk{2, 3, 17, 18}));
}

// チャンクは隙間なく本体を覆う
TEST_F(ChunkerTest, ChunksTileTheBody) {
    std::string source =
        "\\documentclass{book}\n\\begin{document}\n%chunk intro\nWelcome.\n"
        "\\chapter{One}\nText {with} $math$.\n\\begin{figure}\nx\n\\end{figure}\n"
        "%chunk two\n\\chapter{Two}\n\\end{document}\n";
    auto result = chunks(source, {"%chunk", "\\chapter", "{figure}"});
    ASSERT_TRUE(result.ok());
    const auto& list = result.value();
    ASSERT_EQ(list.size(), 6u);

    const auto& body = tree_.body_children();
    uint32_t begin = tree_.node(body.front()).start.offset + 1;
    uint32_t end = tree_.node(body.back()).start.offset;

    EXPECT_EQ(list.front().offset, begin);
    uint32_t total = 0;
    for (size_t i = 0; i < list.size(); ++i) {
        total += list[i].length;
        if (i + 1 < list.size())
            EXPECT_EQ(list[i].offset + list[i].length, list[i + 1].offset);
    }
    EXPECT_EQ(total, end - begin);
}

TEST_F(ChunkerTest, OffsetsCountScalarValues) {
    auto result = chunks("\\begin{document}\n\xc3\xa9\xc3\xa9\n\\section{x}\n\\end{document}",
                         {"\\section"});
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[0], (Chunk{2, 2, 17, 3}));
    EXPECT_EQ(result.value()[1], (Chunk{3, 3, 20, 12}));
}

// 前提条件
TEST_F(ChunkerTest, TrailingContentAfterDocumentBegin) {
    auto result = chunks("\\begin{document}Hello\n\\end{document}", {"\\section"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::TrailingContentAfterDocumentBegin);

    result = chunks("\\begin{document}\\section{A}\n\\end{document}", {"\\section"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::TrailingContentAfterDocumentBegin);

    result = chunks("\\begin{document}\\end{document}", {"\\section"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::TrailingContentAfterDocumentBegin);
}

TEST_F(ChunkerTest, AnchorNotAtLineStart) {
    auto result = chunks("\\begin{document}\ntext \\section{A}\n\\end{document}", {"\\section"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::AnchorNotAtLineStart);
    EXPECT_EQ(result.error().position.line, 1u);
    EXPECT_EQ(result.error().position.column, 5u);
    EXPECT_EQ(result.error().subject, "CNAME '\\\\section'");
}

// 本体の閉じトークンも行頭になければならない
TEST_F(ChunkerTest, DocumentEndNotAtLineStart) {
    auto result = chunks("\\begin{document}\n\\section{A}\ntext \\end{document}", {"m:section"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::AnchorNotAtLineStart);
    EXPECT_EQ(result.error().position.line, 2u);
    EXPECT_EQ(result.error().position.column, 5u);
    EXPECT_EQ(result.error().subject, "END 'document'");

    // アンカーがなくても同じ
    result = chunks("\\begin{document}\ntext \\end{document}\n", {"\\section"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, ErrorKind::AnchorNotAtLineStart);
}
