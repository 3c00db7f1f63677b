#include "../../src/frontend/parser/parser.hpp"
#include "../../src/select/selector.hpp"

#include <gtest/gtest.h>

using namespace chew;
using select::Selector;

class SelectorTest : public ::testing::Test {
   protected:
    Selector compile_ok(const std::string& text) {
        auto result = select::compile(text);
        EXPECT_TRUE(result.ok()) << text;
        return result.ok() ? result.value() : Selector{Selector::Kind::Command, ""};
    }

    SyntaxTree parse(const std::string& source) {
        auto result = Parser(source).parse_document();
        EXPECT_TRUE(result.ok());
        return result.ok() ? std::move(result).value() : SyntaxTree{};
    }

    std::vector<size_t> select_in(const SyntaxTree& tree, const std::vector<std::string>& texts) {
        auto selectors = select::compile_all(texts);
        EXPECT_TRUE(selectors.ok());
        if (!selectors.ok())
            return {};
        return select::select(tree, tree.body_children(), selectors.value());
    }
};

// セレクタの構文
TEST_F(SelectorTest, CommandForms) {
    Selector a = compile_ok("\\section");
    EXPECT_EQ(a.kind, Selector::Kind::Command);
    EXPECT_EQ(a.name, "\\section");

    Selector b = compile_ok("m:section");
    EXPECT_EQ(b.kind, Selector::Kind::Command);
    EXPECT_EQ(b.name, "\\section");
}

TEST_F(SelectorTest, EnvironmentForms) {
    Selector a = compile_ok("{figure*}");
    EXPECT_EQ(a.kind, Selector::Kind::Environment);
    EXPECT_EQ(a.name, "figure*");

    Selector b = compile_ok("e:itemize");
    EXPECT_EQ(b.kind, Selector::Kind::Environment);
    EXPECT_EQ(b.name, "itemize");
}

TEST_F(SelectorTest, CommentForms) {
    Selector a = compile_ok("%chunk");
    EXPECT_EQ(a.kind, Selector::Kind::CommentWord);
    EXPECT_EQ(a.name, "chunk");

    Selector b = compile_ok("c:chunk");
    EXPECT_EQ(b.kind, Selector::Kind::CommentWord);
    EXPECT_EQ(b.name, "chunk");
    EXPECT_EQ(b.to_string(), "%chunk");
}

TEST_F(SelectorTest, InvalidSelectors) {
    for (const char* text : {"section", "", "m:", "e:", "c:", "%", "\\", "{}", "{", "{abc",
                             "x:abc"}) {
        auto result = select::compile(text);
        ASSERT_FALSE(result.ok()) << text;
        EXPECT_EQ(result.error().kind, ErrorKind::InvalidSelectorSyntax);
        EXPECT_EQ(result.error().subject, text);
    }
}

TEST_F(SelectorTest, CompileAllStopsAtFirstInvalid) {
    auto result = select::compile_all({"\\section", "bogus", "also-bogus"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().subject, "bogus");
}

// コメントの先頭の単語
TEST_F(SelectorTest, CommentFirstWord) {
    EXPECT_EQ(select::comment_first_word("%foo bar\n"), "foo");
    EXPECT_EQ(select::comment_first_word("%   foo\tbar\n"), "foo");
    EXPECT_EQ(select::comment_first_word("%\n"), "");
    EXPECT_EQ(select::comment_first_word("%%\n"), "%");
}

TEST_F(SelectorTest, CommentMatchIsExact) {
    Selector sel = compile_ok("%foo");
    Position p;
    auto comment = [&](const std::string& text) {
        return Node{NodeKind::Comment, text, p, std::nullopt};
    };
    EXPECT_TRUE(select::matches(comment("%foo\n"), sel));
    EXPECT_TRUE(select::matches(comment("% foo bar\n"), sel));
    EXPECT_FALSE(select::matches(comment("%foobar\n"), sel));
    EXPECT_FALSE(select::matches(comment("%fo\n"), sel));
    EXPECT_FALSE(select::matches(comment("%bar foo\n"), sel));
    EXPECT_FALSE(select::matches(comment("%\n"), sel));
    EXPECT_FALSE(select::matches(Node{NodeKind::PlainText, "%foo", p, std::nullopt}, sel));
}

TEST_F(SelectorTest, KindMustMatch) {
    Position p;
    Node env{NodeKind::Env, "section", p, std::vector<NodeId>{}};
    Node cmd{NodeKind::CommandName, "\\section", p, std::nullopt};
    EXPECT_FALSE(select::matches(env, compile_ok("\\section")));
    EXPECT_TRUE(select::matches(cmd, compile_ok("\\section")));
    EXPECT_FALSE(select::matches(cmd, compile_ok("{section}")));
    EXPECT_TRUE(select::matches(env, compile_ok("e:section")));
    EXPECT_FALSE(select::matches(cmd, compile_ok("\\sec")));
}

// 文書本体の直下だけを見る
TEST_F(SelectorTest, SelectsTopLevelOnly) {
    auto tree = parse(
        "\\begin{document}\n\\section{A}\n{\\section{nested}}\n\\begin{figure}\n\\section{in}\n"
        "\\end{figure}\n%chunk one\n\\section{B}\n\\end{document}");
    auto indices = select_in(tree, {"\\section"});
    ASSERT_EQ(indices.size(), 2u);
    EXPECT_EQ(tree.node(tree.body_children()[indices[0]]).start.line, 1u);
    EXPECT_EQ(tree.node(tree.body_children()[indices[1]]).start.line, 7u);
}

TEST_F(SelectorTest, SelectorsAreCombinedWithOr) {
    auto tree = parse(
        "\\begin{document}\n\\section{A}\n\\begin{figure}\n\\end{figure}\n%chunk one\n"
        "\\section{B}\n\\end{document}");
    auto indices = select_in(tree, {"{figure}", "c:chunk", "m:section", "\\section"});
    ASSERT_EQ(indices.size(), 4u);
    for (size_t i = 1; i < indices.size(); ++i)
        EXPECT_LT(indices[i - 1], indices[i]);

    const auto& body = tree.body_children();
    EXPECT_EQ(tree.node(body[indices[0]]).kind, NodeKind::CommandName);
    EXPECT_EQ(tree.node(body[indices[1]]).kind, NodeKind::Env);
    EXPECT_EQ(tree.node(body[indices[2]]).kind, NodeKind::Comment);
    EXPECT_EQ(tree.node(body[indices[3]]).kind, NodeKind::CommandName);
}

TEST_F(SelectorTest, CommandInsideGroupIsNotAnchor) {
    auto tree = parse("\\begin{document}\nHello \\textbf{world} {\\em x}\n\\end{document}");
    auto bold = select_in(tree, {"\\textbf"});
    ASSERT_EQ(bold.size(), 1u);
    EXPECT_EQ(bold[0], 1u);
    EXPECT_TRUE(select_in(tree, {"\\em"}).empty());
}

TEST_F(SelectorTest, NoMatches) {
    auto tree = parse("\\begin{document}\nplain\n\\end{document}");
    EXPECT_TRUE(select_in(tree, {"\\section", "{figure}", "%x"}).empty());
}
