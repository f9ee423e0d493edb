#pragma once

#include "../debug.hpp"

#include <string>
#include <vector>

namespace tally::debug::tbl {

enum class Id { DeclareColumn, Abbreviate, Sealed, RowComplete, Widen, Render };

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Declared column", "列を宣言"},
    {"Abbreviated header", "見出しを省略"},
    {"Schema sealed", "列定義を確定"},
    {"Row completed", "行を確定"},
    {"Column widened", "列幅を拡張"},
    {"Rendering table", "表を出力"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::tally::debug::g_lang];
}

inline void log(Id id, ::tally::debug::Level level = ::tally::debug::Level::Debug) {
    if (!::tally::debug::enabled(level))
        return;
    ::tally::debug::log(::tally::debug::Stage::Table, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::tally::debug::Level level = ::tally::debug::Level::Debug) {
    if (!::tally::debug::enabled(level))
        return;
    ::tally::debug::log(::tally::debug::Stage::Table, level,
                        std::string(get(id)) + ": " + detail);
}

/// 列幅一覧をダンプ（Traceレベル）
inline void dump_widths(const std::vector<size_t>& widths) {
    if (!::tally::debug::enabled(::tally::debug::Level::Trace))
        return;
    std::string msg = "Widths:";
    for (auto w : widths) {
        msg += " " + std::to_string(w);
    }
    ::tally::debug::log(::tally::debug::Stage::Table, ::tally::debug::Level::Trace, msg);
}

}  // namespace tally::debug::tbl
