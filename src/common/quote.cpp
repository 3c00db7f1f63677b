#include "quote.hpp"

#include "utf8.hpp"

#include <fmt/format.h>

namespace chew {

std::string quote(std::string_view text) {
    bool has_single = text.find('\'') != std::string_view::npos;
    bool has_double = text.find('"') != std::string_view::npos;
    char q = (has_single && !has_double) ? '"' : '\'';

    std::string out;
    out.reserve(text.size() + 2);
    out += q;
    for (unsigned char c : text) {
        switch (c) {
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (c == static_cast<unsigned char>(q)) {
                    out += '\\';
                    out += static_cast<char>(c);
                } else if (c < 0x20 || c == 0x7f) {
                    out += fmt::format("\\x{:02x}", c);
                } else {
                    out += static_cast<char>(c);
                }
                break;
        }
    }
    out += q;
    return out;
}

std::string quote_truncated(std::string_view text, size_t limit) {
    if (utf8::length(text) <= limit)
        return quote(text);
    return quote(utf8::prefix(text, limit)) + "[...]";
}

std::string elide_middle(std::string_view text, size_t limit, size_t keep) {
    if (utf8::length(text) <= limit)
        return std::string(text);
    std::string out(utf8::prefix(text, keep));
    out += "[...]";
    out += utf8::suffix(text, keep);
    return out;
}

}  // namespace chew
