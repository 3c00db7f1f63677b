// 構文木全体から名前を集める
#include "inventory.hpp"

#include <set>

namespace chew {

namespace {

/// command の直後が中身1つの PlainText だけの Group なら "command{TEXT}" を集める
std::vector<std::string> collect_argument(const SyntaxTree& tree, const std::string& command) {
    std::set<std::string> found;
    for (const auto& v : tree.preorder()) {
        const auto& kids = tree.children(v.id);
        for (size_t i = 0; i + 1 < kids.size(); ++i) {
            const Node& cmd = tree.node(kids[i]);
            if (cmd.kind != NodeKind::CommandName || cmd.text != command)
                continue;

            const Node& group = tree.node(kids[i + 1]);
            if (group.kind != NodeKind::Group)
                continue;
            // 子は [PlainText, End]
            const auto& args = tree.children(kids[i + 1]);
            if (args.size() != 2)
                continue;
            const Node& arg = tree.node(args[0]);
            if (arg.kind == NodeKind::PlainText)
                found.insert(command + "{" + arg.text + "}");
        }
    }
    return {found.begin(), found.end()};
}

}  // namespace

std::vector<std::string> commands(const SyntaxTree& tree) {
    std::set<std::string> found;
    for (const auto& v : tree.preorder()) {
        const Node& n = tree.node(v.id);
        if (n.kind == NodeKind::CommandName)
            found.insert(n.text);
    }
    return {found.begin(), found.end()};
}

std::vector<std::string> labels(const SyntaxTree& tree) {
    return collect_argument(tree, "\\label");
}

std::vector<std::string> references(const SyntaxTree& tree) {
    return collect_argument(tree, "\\ref");
}

}  // namespace chew
