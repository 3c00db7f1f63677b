#include "syntax_tree.hpp"

namespace chew {

NodeId SyntaxTree::add_leaf(NodeKind kind, std::string text, Position start) {
    nodes_.push_back(Node{kind, std::move(text), start, std::nullopt});
    return static_cast<NodeId>(nodes_.size() - 1);
}

NodeId SyntaxTree::add_branch(NodeKind kind, std::string text, Position start) {
    nodes_.push_back(Node{kind, std::move(text), start, std::vector<NodeId>{}});
    return static_cast<NodeId>(nodes_.size() - 1);
}

void SyntaxTree::append_child(NodeId parent, NodeId child) {
    nodes_[parent].children->push_back(child);
}

const std::vector<NodeId>& SyntaxTree::children(NodeId id) const {
    static const std::vector<NodeId> kNone;
    const auto& children = nodes_[id].children;
    return children ? *children : kNone;
}

NodeId SyntaxTree::body() const {
    return children(root_).at(1);
}

std::vector<SyntaxTree::Visit> SyntaxTree::preorder() const {
    std::vector<Visit> order;
    if (nodes_.empty())
        return order;
    order.reserve(nodes_.size());

    std::vector<Visit> stack;
    stack.push_back(Visit{root_, 0, std::nullopt});
    while (!stack.empty()) {
        Visit v = stack.back();
        stack.pop_back();
        order.push_back(v);

        // 子は逆順に積んで左から取り出す
        const auto& kids = children(v.id);
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
            stack.push_back(Visit{*it, v.depth + 1, v.id});
        }
    }
    return order;
}

std::string SyntaxTree::spelling(NodeId id, std::optional<NodeId> parent) const {
    const Node& n = nodes_[id];
    switch (n.kind) {
        case NodeKind::File:
            return "";
        case NodeKind::Env:
            return token_spelling(TokenKind::EnvBegin, n.text);
        case NodeKind::End:
            if (parent && nodes_[*parent].kind == NodeKind::Env)
                return token_spelling(TokenKind::EnvEnd, n.text);
            return n.text;
        default:
            return n.text;
    }
}

std::string SyntaxTree::to_source() const {
    std::string out;
    for (const auto& v : preorder()) {
        out += spelling(v.id, v.parent);
    }
    return out;
}

}  // namespace chew
