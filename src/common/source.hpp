#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace chew {

/// ソースファイルを管理するクラス
class Source {
   public:
    /// ソースコードから作成
    explicit Source(std::string content, std::string filename = "<stdin>")
        : content_(std::move(content)), filename_(std::move(filename)) {
        build_line_starts();
    }

    /// ソースコード全体を取得
    std::string_view content() const { return content_; }

    /// ファイル名を取得
    std::string_view filename() const { return filename_; }

    /// 行数
    size_t line_count() const { return line_starts_.size(); }

    /// 指定行の内容を取得（1始まり、改行文字は除く）
    std::string_view get_line(uint32_t line_number) const {
        if (line_number == 0 || line_number > line_starts_.size()) {
            return "";
        }
        size_t start = line_starts_[line_number - 1];
        size_t end =
            (line_number < line_starts_.size()) ? line_starts_[line_number] : content_.size();
        while (end > start && (content_[end - 1] == '\n' || content_[end - 1] == '\r')) {
            --end;
        }
        return std::string_view(content_).substr(start, end - start);
    }

   private:
    void build_line_starts() {
        line_starts_.clear();
        line_starts_.push_back(0);
        for (size_t i = 0; i < content_.size(); ++i) {
            if (content_[i] == '\n') {
                line_starts_.push_back(i + 1);
            }
        }
    }

    std::string content_;
    std::string filename_;
    std::vector<size_t> line_starts_;  // 各行の開始バイトオフセット
};

}  // namespace chew
