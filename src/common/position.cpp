#include "position.hpp"

#include "utf8.hpp"

namespace chew {

Position Position::advance(std::string_view text) const {
    Position next = *this;
    for (unsigned char b : text) {
        // 継続バイトは直前のスカラ値の一部
        if (utf8::is_continuation(b))
            continue;
        ++next.offset;
        if (b == '\n') {
            ++next.line;
            next.column = 0;
        } else {
            ++next.column;
        }
    }
    next.byte += static_cast<uint32_t>(text.size());
    return next;
}

}  // namespace chew
