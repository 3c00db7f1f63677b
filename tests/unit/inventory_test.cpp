#include "../../src/frontend/parser/parser.hpp"
#include "../../src/frontend/tree/inventory.hpp"

#include <gtest/gtest.h>

using namespace chew;

class InventoryTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto result = Parser(
                          "\\documentclass{article}\n\\newcommand{\\pre}{x}\n"
                          "\\begin{document}\n"
                          "\\section{Intro}\\label{sec:intro}\n"
                          "See \\ref{sec:method} and \\ref{sec:intro}.\n"
                          "\\begin{equation}\\label{eq:1} a \\end{equation}\n"
                          "{\\em \\ref{sec:intro}}\n"
                          "\\label{dup}\\label{dup}\n"
                          "\\label {spaced} \\label{\\x} \\ref{a{b}}\n"
                          "\\begin{verbatim}\\label{hidden}\\end{verbatim}\n"
                          "\\end{document}\n\\label{post}")
                          .parse_document();
        ASSERT_TRUE(result.ok());
        tree_ = std::move(result).value();
    }

    SyntaxTree tree_;
};

// コマンド名は本体全体から集める
TEST_F(InventoryTest, Commands) {
    auto names = commands(tree_);
    EXPECT_EQ(names, (std::vector<std::string>{"\\em", "\\label", "\\ref", "\\section", "\\x"}));
}

TEST_F(InventoryTest, Labels) {
    auto names = labels(tree_);
    EXPECT_EQ(names, (std::vector<std::string>{"\\label{dup}", "\\label{eq:1}",
                                                "\\label{sec:intro}"}));
}

TEST_F(InventoryTest, References) {
    auto names = references(tree_);
    EXPECT_EQ(names, (std::vector<std::string>{"\\ref{sec:intro}", "\\ref{sec:method}"}));
}

TEST_F(InventoryTest, EmptyDocument) {
    auto result = Parser("\\begin{document}\\end{document}").parse_document();
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(commands(result.value()).empty());
    EXPECT_TRUE(labels(result.value()).empty());
    EXPECT_TRUE(references(result.value()).empty());
}
