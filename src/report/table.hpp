#pragma once

// ============================================================
// Table - 集計結果を端末向けの表に整形
// ============================================================
// 1. declare_column() で列を宣言
// 2. add_entry() で値を左から順に追加（列数ごとに自動で改行）
// 3. to_string() で出力（列幅は全行を見てから確定）
// ============================================================

#include <fmt/format.h>

#include <string>
#include <utility>
#include <vector>

namespace tally {
namespace report {

class Table {
   public:
    /// 列を追加。abbreviate なら小文字を除いた略称を見出しにする
    /// 既存の見出しと重なる場合は ' を付け足す
    void declare_column(const std::string& name, bool abbreviate = false);

    /// 値を追加。column_count() 個ごとに新しい行になる
    void add_entry(const std::string& entry);
    void add_entry(const char* entry) { add_entry(std::string(entry)); }

    template <typename T>
    void add_entry(const T& value) {
        add_entry(fmt::to_string(value));
    }

    /// 見出し行を挿入（長い表では何度でも可）
    void add_header();

    /// 区切り行を挿入
    void add_divider();

    size_t column_count() const { return header_.size(); }
    const std::vector<std::string>& header() const { return header_; }
    const std::vector<size_t>& widths() const { return widths_; }

    /// 略称 -> 元の名前（宣言順）
    const std::vector<std::pair<std::string, std::string>>& abbreviations() const {
        return abbreviations_;
    }

    /// 値の追加が始まり、列を増やせない状態か
    bool is_sealed() const { return sealed_; }

    /// 端末表示用の文字列を生成
    std::string to_string() const;

   private:
    enum class RowKind { Cells, Header, Divider };

    struct Row {
        RowKind kind;
        std::vector<std::string> cells;  // Cells のときのみ
    };

    bool has_header(const std::string& name) const;

    std::vector<std::string> header_;
    std::vector<size_t> widths_;
    std::vector<std::pair<std::string, std::string>> abbreviations_;
    std::vector<Row> rows_;
    std::vector<std::string> current_row_;
    bool sealed_ = false;
};

}  // namespace report
}  // namespace tally
