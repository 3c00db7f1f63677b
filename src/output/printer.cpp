// 結果の表示
#include "printer.hpp"

#include "common/quote.hpp"
#include "common/utf8.hpp"

#include <fmt/format.h>

namespace chew::output {

namespace {

// 構文木: これより長いテキストは前後だけ表示
constexpr size_t kTreeTextLimit = 16;
constexpr size_t kTreeTextKeep = 8;

// トークン: この長さ以上は切り詰める
constexpr size_t kTokenTextLimit = 16;

// アンカー
constexpr size_t kAnchorTextLimit = 32;

}  // namespace

std::string format_tree_line(const Node& node, size_t depth) {
    return fmt::format("{:05d}:{:04d}-{:02d}: {}{}: {}", node.start.offset, node.start.line + 1,
                       node.start.column + 1, std::string(depth * 4, ' '),
                       node_kind_to_string(node.kind),
                       quote(elide_middle(node.text, kTreeTextLimit, kTreeTextKeep)));
}

std::string format_token_line(const Token& token) {
    std::string text = token.text;
    if (utf8::length(text) >= kTokenTextLimit)
        text = std::string(utf8::prefix(text, kTokenTextLimit)) + "...";
    return fmt::format("{} {} {} {} : {}", token.start.offset, token.start.line,
                       token.start.column, token_kind_to_string(token.kind), quote(text));
}

std::string format_anchor_line(const Node& node) {
    return fmt::format("line {} char {} kind {} name {}", node.start.line + 1, node.start.offset,
                       node_kind_to_string(node.kind),
                       quote_truncated(node.text, kAnchorTextLimit));
}

std::string format_chunk_line(const select::Chunk& chunk) {
    return fmt::format("lines {} {} chars {} {}", chunk.start_line, chunk.end_line, chunk.offset,
                       chunk.length);
}

void print_tree(const SyntaxTree& tree, std::ostream& out) {
    for (const auto& v : tree.preorder()) {
        out << format_tree_line(tree.node(v.id), v.depth) << "\n";
    }
}

void print_tokens(const std::vector<Token>& tokens, std::ostream& out) {
    for (const auto& tok : tokens) {
        if (tok.kind == TokenKind::EndOfInput)
            break;
        out << format_token_line(tok) << "\n";
    }
}

void print_anchors(const SyntaxTree& tree, const std::vector<size_t>& indices, std::ostream& out) {
    const auto& body = tree.body_children();
    for (size_t index : indices) {
        out << format_anchor_line(tree.node(body.at(index))) << "\n";
    }
}

void print_chunks(const std::vector<select::Chunk>& chunks, std::ostream& out) {
    for (const auto& chunk : chunks) {
        out << format_chunk_line(chunk) << "\n";
    }
}

void print_list(const std::vector<std::string>& items, std::ostream& out) {
    for (const auto& item : items) {
        out << item << "\n";
    }
}

}  // namespace chew::output
