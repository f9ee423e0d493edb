#pragma once

#include "../debug.hpp"

#include <string>

namespace tally::debug::cnt {

enum class Id { Start, End, Package, Library, Html, NewKind };

inline const char* messages[][2] = {
    {"Starting aggregation", "集計を開始"},
    {"Completed aggregation", "集計を完了"},
    {"Visiting package", "パッケージを訪問"},
    {"Visiting library", "ライブラリを訪問"},
    {"Visiting HTML unit", "HTML単位を訪問"},
    {"New diagnostic kind", "新しい診断種別"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::tally::debug::g_lang];
}

inline void log(Id id, ::tally::debug::Level level = ::tally::debug::Level::Debug) {
    if (!::tally::debug::enabled(level))
        return;
    ::tally::debug::log(::tally::debug::Stage::Counter, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::tally::debug::Level level = ::tally::debug::Level::Debug) {
    if (!::tally::debug::enabled(level))
        return;
    ::tally::debug::log(::tally::debug::Stage::Counter, level,
                        std::string(get(id)) + ": " + detail);
}

}  // namespace tally::debug::cnt
