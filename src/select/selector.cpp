// セレクタのコンパイルと適用
#include "selector.hpp"

#include "common/debug/sel.hpp"

namespace chew::select {

namespace {

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

std::string Selector::to_string() const {
    switch (kind) {
        case Kind::Command:
            return name;
        case Kind::Environment:
            return "{" + name + "}";
        case Kind::CommentWord:
            return "%" + name;
    }
    return name;
}

Result<Selector> compile(std::string_view text) {
    debug::sel::log(debug::sel::Id::Compile, std::string(text), debug::Level::Trace);

    Selector sel{Selector::Kind::Command, ""};
    if (starts_with(text, "\\")) {
        sel = {Selector::Kind::Command, std::string(text)};
        if (text.size() == 1)
            sel.name.clear();
    } else if (starts_with(text, "m:")) {
        if (text.size() > 2)
            sel = {Selector::Kind::Command, "\\" + std::string(text.substr(2))};
    } else if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
        sel = {Selector::Kind::Environment, std::string(text.substr(1, text.size() - 2))};
    } else if (starts_with(text, "e:")) {
        sel = {Selector::Kind::Environment, std::string(text.substr(2))};
    } else if (starts_with(text, "%")) {
        sel = {Selector::Kind::CommentWord, std::string(text.substr(1))};
    } else if (starts_with(text, "c:")) {
        sel = {Selector::Kind::CommentWord, std::string(text.substr(2))};
    }

    if (sel.name.empty()) {
        debug::sel::log(debug::sel::Id::Invalid, std::string(text), debug::Level::Error);
        return Result<Selector>::Failure(Error::invalid_selector(std::string(text)));
    }
    return Result<Selector>::Success(std::move(sel));
}

Result<std::vector<Selector>> compile_all(const std::vector<std::string>& texts) {
    std::vector<Selector> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        auto sel = compile(text);
        if (!sel)
            return Result<std::vector<Selector>>::Failure(sel.error());
        out.push_back(std::move(sel).value());
    }
    return Result<std::vector<Selector>>::Success(std::move(out));
}

std::string_view comment_first_word(std::string_view comment) {
    if (starts_with(comment, "%"))
        comment.remove_prefix(1);
    size_t begin = 0;
    while (begin < comment.size() && is_space(comment[begin]))
        ++begin;
    size_t end = begin;
    while (end < comment.size() && !is_space(comment[end]))
        ++end;
    return comment.substr(begin, end - begin);
}

bool matches(const Node& node, const Selector& selector) {
    switch (selector.kind) {
        case Selector::Kind::Command:
            return node.kind == NodeKind::CommandName && node.text == selector.name;
        case Selector::Kind::Environment:
            return node.kind == NodeKind::Env && node.text == selector.name;
        case Selector::Kind::CommentWord: {
            if (node.kind != NodeKind::Comment)
                return false;
            std::string_view word = comment_first_word(node.text);
            return !word.empty() && word == selector.name;
        }
    }
    return false;
}

std::vector<size_t> select(const SyntaxTree& tree, const std::vector<NodeId>& candidates,
                           const std::vector<Selector>& selectors) {
    std::vector<size_t> indices;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const Node& node = tree.node(candidates[i]);
        for (const auto& sel : selectors) {
            if (matches(node, sel)) {
                debug::sel::log(debug::sel::Id::Match,
                                std::to_string(i) + " " + sel.to_string(), debug::Level::Trace);
                indices.push_back(i);
                break;
            }
        }
    }
    debug::sel::log(debug::sel::Id::Selected, std::to_string(indices.size()));
    return indices;
}

}  // namespace chew::select
