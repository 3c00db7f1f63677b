#pragma once

#include "common/position.hpp"
#include "frontend/lexer/token.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chew {

/// 構文木ノードのID（SyntaxTree内のインデックス）
using NodeId = uint32_t;

/// ノードの種類
enum class NodeKind {
    // 葉
    CommandName,
    Comment,
    PlainText,
    VerbatimBlock,

    // 構造（子は必ず End で終わる）
    Env,
    DisplayMath,
    InlineMath,
    Group,

    // 文書レベルの合成ノード
    File,
    Preamble,
    Postamble,
    End,
};

/// 構文木ノード
///
/// children は葉では std::nullopt（空リストとは区別する）。
struct Node {
    NodeKind kind;
    std::string text;  // Env は環境名、それ以外はトークンのテキスト
    Position start;
    std::optional<std::vector<NodeId>> children;

    bool is_leaf() const { return !children.has_value(); }
};

/// 表示用の種類名（ENV, DMATH, TMATH, GROUP, CNAME, ...）
const char* node_kind_to_string(NodeKind kind);

/// 構造ノードか
bool is_construct(NodeKind kind);

/// トークンの種類から対応するノードの種類を求める（EndOfInput/閉じトークンは不可）
std::optional<NodeKind> node_kind_for_token(TokenKind kind);

}  // namespace chew
