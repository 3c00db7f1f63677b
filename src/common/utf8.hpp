#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace chew::utf8 {

/// 継続バイト（10xxxxxx）か
inline bool is_continuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

/// 先頭バイトから1スカラ値のバイト長を求める（不正なバイトは1として扱う）
inline size_t sequence_length(unsigned char lead) {
    if (lead < 0x80)
        return 1;
    if ((lead & 0xE0) == 0xC0)
        return 2;
    if ((lead & 0xF0) == 0xE0)
        return 3;
    if ((lead & 0xF8) == 0xF0)
        return 4;
    return 1;
}

/// スカラ値の数
inline size_t length(std::string_view text) {
    size_t n = 0;
    for (unsigned char b : text) {
        if (!is_continuation(b))
            ++n;
    }
    return n;
}

/// 先頭からcountスカラ値分のバイト数
inline size_t prefix_bytes(std::string_view text, size_t count) {
    size_t i = 0;
    while (i < text.size() && count > 0) {
        size_t len = sequence_length(static_cast<unsigned char>(text[i]));
        i = std::min(i + len, text.size());
        --count;
    }
    return i;
}

/// 先頭countスカラ値
inline std::string_view prefix(std::string_view text, size_t count) {
    return text.substr(0, prefix_bytes(text, count));
}

/// 末尾countスカラ値
inline std::string_view suffix(std::string_view text, size_t count) {
    size_t total = length(text);
    if (count >= total)
        return text;
    return text.substr(prefix_bytes(text, total - count));
}

}  // namespace chew::utf8
