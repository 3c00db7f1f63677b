#pragma once

#include "node.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace chew {

/// 構文木（フラットな配列に全ノードを保持し、子はインデックスで参照する）
///
/// 構築後は読み取り専用。親への参照は持たない。
class SyntaxTree {
   public:
    /// 走査時の1エントリ
    struct Visit {
        NodeId id;
        size_t depth;
        std::optional<NodeId> parent;
    };

    /// 葉ノードを追加（まだどこにも接続しない）
    NodeId add_leaf(NodeKind kind, std::string text, Position start);

    /// 子を持つノードを追加（子リストは空で開始）
    NodeId add_branch(NodeKind kind, std::string text, Position start);

    /// parentの子リストの末尾にchildを追加
    void append_child(NodeId parent, NodeId child);

    /// ノードの開始位置を設定（Fileの位置は構築の最後に決まる）
    void set_start(NodeId id, Position start) { nodes_[id].start = start; }

    void set_root(NodeId id) { root_ = id; }
    NodeId root() const { return root_; }

    const Node& node(NodeId id) const { return nodes_[id]; }
    size_t size() const { return nodes_.size(); }

    /// 子のリスト（葉では空）
    const std::vector<NodeId>& children(NodeId id) const;

    /// 文書本体の Env ノード（File の2番目の子）
    NodeId body() const;

    /// 文書本体の直下の子（末尾は End）
    const std::vector<NodeId>& body_children() const { return children(body()); }

    /// 前順走査（明示的スタックで実装）
    std::vector<Visit> preorder() const;

    /// ノード自身が入力上で占める綴り（Envは \begin{..}、Envの End は \end{..}）
    std::string spelling(NodeId id, std::optional<NodeId> parent) const;

    /// 全ノードの綴りを木の順に連結して元の入力を再構成
    std::string to_source() const;

   private:
    std::vector<Node> nodes_;
    NodeId root_ = 0;
};

}  // namespace chew
