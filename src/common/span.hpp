#pragma once

#include <algorithm>
#include <cstdint>
#include <string>

namespace tally {

/// ソースコード内の位置情報
struct Span {
    uint32_t start;  // 開始オフセット（バイト）
    uint32_t end;    // 終了オフセット（バイト）

    static Span empty() { return Span{0, 0}; }

    /// 逆順のオフセットも受け付ける
    static Span between(uint32_t a, uint32_t b) { return Span{std::min(a, b), std::max(a, b)}; }

    Span merge(const Span& other) const {
        return Span{std::min(start, other.start), std::max(end, other.end)};
    }

    uint32_t length() const { return end - start; }
    bool is_empty() const { return start == end; }
};

/// 行・列情報（エラー表示用）
struct LineColumn {
    uint32_t line;    // 1-indexed（0は未解決）
    uint32_t column;  // 1-indexed（0は未解決）
};

/// 解決済みの位置情報（ファイル名・行列・行テキスト付き）
struct SourceLocation {
    std::string file;
    Span span = Span::empty();
    LineColumn begin{0, 0};
    LineColumn end{0, 0};
    std::string line_text;  // 開始行の内容

    bool is_resolved() const { return begin.line > 0; }
};

}  // namespace tally
