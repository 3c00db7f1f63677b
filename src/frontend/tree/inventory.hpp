#pragma once

#include "syntax_tree.hpp"

#include <string>
#include <vector>

namespace chew {

/// 文書本体で使われているコマンド名（整列・重複なし）
std::vector<std::string> commands(const SyntaxTree& tree);

/// \label{TEXT} の一覧（整列・重複なし）
std::vector<std::string> labels(const SyntaxTree& tree);

/// \ref{TEXT} の一覧（整列・重複なし）
std::vector<std::string> references(const SyntaxTree& tree);

}  // namespace chew
