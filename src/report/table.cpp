#include "table.hpp"

#include "common/debug_messages.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iterator>

namespace tally {
namespace report {

bool Table::has_header(const std::string& name) const {
    return std::find(header_.begin(), header_.end(), name) != header_.end();
}

void Table::declare_column(const std::string& name, bool abbreviate) {
    if (sealed_) {
        throw SchemaFrozenError(
            fmt::format("cannot declare column '{}' after entries were added", name));
    }

    std::string header_name = name;
    if (abbreviate) {
        // 大文字の頭文字だけを残す（空になる場合は元の名前）
        std::string abbr;
        std::copy_if(name.begin(), name.end(), std::back_inserter(abbr),
                     [](char c) { return !(c >= 'a' && c <= 'z'); });
        if (!abbr.empty()) {
            header_name = abbr;
        }
        // 既存の見出しと重ならないようにする
        while (has_header(header_name)) {
            header_name += '\'';
        }
        if (header_name != name) {
            abbreviations_.emplace_back(header_name, name);
            debug::tbl::log(debug::tbl::Id::Abbreviate, header_name + " = " + name,
                            debug::Level::Trace);
        }
    }

    widths_.push_back(std::max<size_t>(5, header_name.size() + 1));
    header_.push_back(std::move(header_name));
    debug::tbl::log(debug::tbl::Id::DeclareColumn, name, debug::Level::Trace);
}

void Table::add_entry(const std::string& entry) {
    if (header_.empty()) {
        throw MalformedTableError("cannot add entry '" + entry + "' to a table without columns");
    }
    if (!sealed_) {
        sealed_ = true;
        debug::tbl::log(debug::tbl::Id::Sealed, std::to_string(header_.size()) + " columns");
    }

    size_t pos = current_row_.size();
    if (entry.size() + 1 > widths_[pos]) {
        widths_[pos] = entry.size() + 1;
        debug::tbl::log(debug::tbl::Id::Widen, header_[pos], debug::Level::Trace);
    }
    current_row_.push_back(entry);

    if (current_row_.size() == header_.size()) {
        rows_.push_back({RowKind::Cells, std::move(current_row_)});
        current_row_.clear();
        debug::tbl::log(debug::tbl::Id::RowComplete, debug::Level::Trace);
    }
}

void Table::add_header() {
    rows_.push_back({RowKind::Header, {}});
}

void Table::add_divider() {
    rows_.push_back({RowKind::Divider, {}});
}

std::string Table::to_string() const {
    if (!current_row_.empty()) {
        throw MalformedTableError(fmt::format("last row has {} of {} entries",
                                              current_row_.size(), header_.size()));
    }

    debug::tbl::log(debug::tbl::Id::Render, std::to_string(rows_.size()) + " rows");
    debug::tbl::dump_widths(widths_);

    std::string out;
    for (const auto& row : rows_) {
        for (size_t i = 0; i < header_.size(); ++i) {
            std::string entry;
            switch (row.kind) {
                case RowKind::Cells:
                    entry = row.cells[i];
                    break;
                case RowKind::Header:
                    entry = header_[i];
                    break;
                case RowKind::Divider:
                    // 区切りは最終的な列幅で描く
                    entry = std::string(widths_[i], '-');
                    break;
            }
            // 先頭列は左寄せ、それ以外は右寄せ
            if (i == 0) {
                out += fmt::format("{:<{}}", entry, widths_[i]);
            } else {
                out += fmt::format("{:>{}}", entry, widths_[i] + 1);
            }
        }
        out += '\n';
    }

    if (!abbreviations_.empty()) {
        out += '\n';
        for (const auto& [abbr, name] : abbreviations_) {
            out += fmt::format("{:<7} {}\n", "  " + abbr + ":", name);
        }
    }
    return out;
}

}  // namespace report
}  // namespace tally
