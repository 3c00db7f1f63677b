#pragma once

#include "common/result.hpp"
#include "frontend/tree/syntax_tree.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace chew::select {

/// コンパイル済みセレクタ
struct Selector {
    enum class Kind {
        Command,      // \NAME, m:NAME
        Environment,  // {NAME}, e:NAME
        CommentWord,  // %WORD, c:WORD
    };

    Kind kind;
    std::string name;  // Command は先頭の \ を含む綴り

    /// 表示用（\NAME, {NAME}, %WORD）
    std::string to_string() const;
};

/// セレクタ文字列をコンパイル
Result<Selector> compile(std::string_view text);

/// 複数のセレクタをコンパイル（最初の不正なもので失敗）
Result<std::vector<Selector>> compile_all(const std::vector<std::string>& texts);

/// コメントの先頭の単語（%の後、空白区切り。なければ空）
std::string_view comment_first_word(std::string_view comment);

/// ノードがセレクタに一致するか
bool matches(const Node& node, const Selector& selector);

/// candidates のうち、いずれかのセレクタに一致するもののインデックス（昇順）
///
/// 入れ子の中は見ない。
std::vector<size_t> select(const SyntaxTree& tree, const std::vector<NodeId>& candidates,
                           const std::vector<Selector>& selectors);

}  // namespace chew::select
