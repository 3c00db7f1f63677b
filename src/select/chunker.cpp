// チャンク境界の計算
#include "chunker.hpp"

#include "common/debug/sel.hpp"
#include "common/quote.hpp"

#include <fmt/format.h>

namespace chew::select {

namespace {

// 表示用のアンカーの抜粋の長さ
constexpr size_t kAnchorExcerpt = 32;

}  // namespace

Result<std::vector<Chunk>> compute_chunks(const SyntaxTree& tree,
                                          const std::vector<size_t>& anchors) {
    const auto& body = tree.body_children();
    debug::sel::log_chunk(debug::sel::Id::ChunkStart, std::to_string(anchors.size()) + " anchors");

    // 本体は \begin{document} の直後の改行から始まる
    const Node& first = tree.node(body.front());
    if (first.kind != NodeKind::PlainText || first.text.empty() || first.text.front() != '\n') {
        return Result<std::vector<Chunk>>::Failure(
            Error::trailing_content(first.start, quote_truncated(first.text, kAnchorExcerpt)));
    }

    std::vector<Position> bounds;
    bounds.reserve(anchors.size() + 2);
    bounds.push_back(first.start.advance("\n"));

    // 選ばれたアンカーと本体の閉じトークンはどれも行頭になければならない
    std::vector<NodeId> boundary_nodes;
    boundary_nodes.reserve(anchors.size() + 1);
    for (size_t index : anchors)
        boundary_nodes.push_back(body.at(index));
    boundary_nodes.push_back(body.back());

    for (NodeId id : boundary_nodes) {
        const Node& anchor = tree.node(id);
        if (anchor.start.column != 0) {
            std::string shown = fmt::format("{} {}", node_kind_to_string(anchor.kind),
                                            quote_truncated(anchor.text, kAnchorExcerpt));
            debug::sel::log_chunk(debug::sel::Id::NotAtLineStart, shown, debug::Level::Error);
            return Result<std::vector<Chunk>>::Failure(
                Error::anchor_not_at_line_start(anchor.start, std::move(shown)));
        }
        bounds.push_back(anchor.start);
    }

    std::vector<Chunk> chunks;
    chunks.reserve(bounds.size() - 1);
    for (size_t i = 0; i + 1 < bounds.size(); ++i) {
        const Position& cur = bounds[i];
        const Position& next = bounds[i + 1];
        chunks.push_back(Chunk{cur.line + 1, next.line, cur.offset, next.offset - cur.offset});
        debug::sel::log_chunk(debug::sel::Id::Boundary,
                              fmt::format("{}..{}", cur.offset, next.offset),
                              debug::Level::Trace);
    }

    debug::sel::log_chunk(debug::sel::Id::ChunkEnd, std::to_string(chunks.size()));
    return Result<std::vector<Chunk>>::Success(std::move(chunks));
}

}  // namespace chew::select
