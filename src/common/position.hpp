#pragma once

#include <cstdint>
#include <string_view>

namespace chew {

/// ソース内の位置情報（不変）
///
/// offset/line/column はすべて0始まりで、offset はUnicodeスカラ値単位で数える。
/// byte は同じ位置のUTF-8バイトオフセットで、ソースの切り出しにのみ使う。
struct Position {
    uint32_t offset = 0;  // スカラ値オフセット
    uint32_t line = 0;    // 行（0始まり）
    uint32_t column = 0;  // 列（0始まり）
    uint32_t byte = 0;    // バイトオフセット

    /// textを読み進めた後の位置を返す
    Position advance(std::string_view text) const;

    bool operator==(const Position& other) const {
        return offset == other.offset && line == other.line && column == other.column &&
               byte == other.byte;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

}  // namespace chew
