#pragma once

#include "frontend/lexer/token.hpp"
#include "frontend/tree/syntax_tree.hpp"
#include "select/chunker.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace chew::output {

/// 1ノード1行で構文木を表示
///
///   OOOOO:LLLL-CC: <深さ x 4空白>KIND: 'text'
void print_tree(const SyntaxTree& tree, std::ostream& out);

/// トークン列を表示（EndOfInputは除く）
///
///   OFFSET LINE COLUMN KIND : 'text'
void print_tokens(const std::vector<Token>& tokens, std::ostream& out);

/// 選択されたアンカーを表示（indices は body_children() のインデックス）
///
///   line L char O kind K name 'text'
void print_anchors(const SyntaxTree& tree, const std::vector<size_t>& indices, std::ostream& out);

/// チャンクを表示
///
///   lines S E chars O N
void print_chunks(const std::vector<select::Chunk>& chunks, std::ostream& out);

/// 1行1項目で表示
void print_list(const std::vector<std::string>& items, std::ostream& out);

/// 各形式の1行分（テスト用に公開）
std::string format_tree_line(const Node& node, size_t depth);
std::string format_token_line(const Token& token);
std::string format_anchor_line(const Node& node);
std::string format_chunk_line(const select::Chunk& chunk);

}  // namespace chew::output
