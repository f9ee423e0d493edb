#pragma once

#include "../debug.hpp"

#include <string>

namespace tally::debug::cfg {

enum class Id { Search, Found, NotFound, Loaded, UnknownKey, Override };

inline const char* messages[][2] = {
    {"Searching config", "設定ファイルを探索"},
    {"Config found", "設定ファイルを発見"},
    {"Config not found", "設定ファイルが見つかりません"},
    {"Config loaded", "設定を読み込み"},
    {"Ignoring unknown key", "不明なキーを無視"},
    {"Command line override", "コマンドラインで上書き"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::tally::debug::g_lang];
}

inline void log(Id id, ::tally::debug::Level level = ::tally::debug::Level::Debug) {
    if (!::tally::debug::enabled(level))
        return;
    ::tally::debug::log(::tally::debug::Stage::Config, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::tally::debug::Level level = ::tally::debug::Level::Debug) {
    if (!::tally::debug::enabled(level))
        return;
    ::tally::debug::log(::tally::debug::Stage::Config, level,
                        std::string(get(id)) + ": " + detail);
}

}  // namespace tally::debug::cfg
