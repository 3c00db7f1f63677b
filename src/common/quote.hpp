#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace chew {

/// テキストを引用符付きのリテラル表記にする（'...' 形式、制御文字はエスケープ）
///
/// 単引用符を含み二重引用符を含まない場合は "..." で囲む。
std::string quote(std::string_view text);

/// 先頭limitスカラ値までを引用し、超えた分は "[...]" で示す
std::string quote_truncated(std::string_view text, size_t limit);

/// 長いテキストを「先頭keep + [...] + 末尾keep」に縮める（短ければそのまま）
std::string elide_middle(std::string_view text, size_t limit, size_t keep);

}  // namespace chew
