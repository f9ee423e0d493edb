#pragma once

#include "span.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace tally {

/// 解析対象のソース（コンパイル単位）を管理するクラス
class Source {
   public:
    /// ソースコードから作成
    explicit Source(std::string content, std::string filename = "<input>")
        : content_(std::move(content)), filename_(std::move(filename)) {
        build_line_starts();
    }

    /// ソースコード全体を取得
    std::string_view content() const { return content_; }

    /// ファイル名を取得
    std::string_view filename() const { return filename_; }

    /// Spanから文字列を取得
    std::string_view get_text(Span span) const {
        if (span.start >= content_.size())
            return "";
        return std::string_view(content_).substr(span.start, span.length());
    }

    /// オフセットから行・列を取得（範囲外は末尾に丸める）
    LineColumn get_line_column(uint32_t offset) const {
        offset = std::min<uint32_t>(offset, static_cast<uint32_t>(content_.size()));
        // 二分探索で行を特定
        auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
        uint32_t line = static_cast<uint32_t>(it - line_starts_.begin());
        uint32_t column = offset - line_starts_[line - 1] + 1;
        return LineColumn{line, column};
    }

    /// 指定行の内容を取得
    std::string_view get_line(uint32_t line_number) const {
        if (line_number == 0 || line_number > line_starts_.size()) {
            return "";
        }
        uint32_t start = line_starts_[line_number - 1];
        uint32_t end = (line_number < line_starts_.size()) ? line_starts_[line_number]
                                                           : static_cast<uint32_t>(content_.size());
        // 改行文字を除去
        while (end > start && (content_[end - 1] == '\n' || content_[end - 1] == '\r')) {
            --end;
        }
        return std::string_view(content_).substr(start, end - start);
    }

    /// 行数（末尾の改行の後ろは数えない）
    uint32_t line_count() const {
        if (content_.empty())
            return 0;
        auto lines = static_cast<uint32_t>(line_starts_.size());
        return content_.back() == '\n' ? lines - 1 : lines;
    }

    /// Spanを位置情報に解決
    SourceLocation locate(Span span) const {
        SourceLocation loc;
        loc.file = filename_;
        loc.span = span;
        loc.begin = get_line_column(span.start);
        loc.end = get_line_column(span.end);
        loc.line_text = std::string(get_line(loc.begin.line));
        return loc;
    }

   private:
    void build_line_starts() {
        line_starts_.clear();
        line_starts_.push_back(0);
        for (size_t i = 0; i < content_.size(); ++i) {
            if (content_[i] == '\n') {
                line_starts_.push_back(static_cast<uint32_t>(i + 1));
            }
        }
    }

    std::string content_;
    std::string filename_;
    std::vector<uint32_t> line_starts_;  // 各行の開始オフセット（先頭は0）
};

}  // namespace tally
