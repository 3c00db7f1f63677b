#pragma once

#include "common/result.hpp"
#include "frontend/tree/syntax_tree.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace chew::select {

/// アンカー間のテキスト範囲
///
/// start_line は1始まり、end_line は次の境界の行（0始まり）をそのまま使う。
/// 次の境界が行頭にあるので、結果として end_line はこの範囲の最終行（1始まり）になる。
struct Chunk {
    uint32_t start_line;
    uint32_t end_line;
    uint32_t offset;  // スカラ値単位
    uint32_t length;

    bool operator==(const Chunk& other) const {
        return start_line == other.start_line && end_line == other.end_line &&
               offset == other.offset && length == other.length;
    }
};

/// 選択されたアンカー（body_children() のインデックス、昇順）から文書本体を区切る
///
/// 本体の先頭が改行で始まる PlainText でなければ TrailingContentAfterDocumentBegin、
/// アンカーか本体の閉じトークンが行頭になければ AnchorNotAtLineStart で失敗する。
Result<std::vector<Chunk>> compute_chunks(const SyntaxTree& tree,
                                          const std::vector<size_t>& anchors);

}  // namespace chew::select
