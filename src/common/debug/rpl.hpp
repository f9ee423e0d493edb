#pragma once

#include "../debug.hpp"

#include <string>

namespace tally::debug::rpl {

enum class Id { Start, End, Event, SourceLoaded, Skip };

inline const char* messages[][2] = {
    {"Starting trace replay", "トレース再生を開始"},
    {"Completed trace replay", "トレース再生を完了"},
    {"Replaying event", "イベントを再生"},
    {"Loaded source", "ソースを読み込み"},
    {"Skipping line", "行をスキップ"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::tally::debug::g_lang];
}

inline void log(Id id, ::tally::debug::Level level = ::tally::debug::Level::Debug) {
    if (!::tally::debug::enabled(level))
        return;
    ::tally::debug::log(::tally::debug::Stage::Replay, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::tally::debug::Level level = ::tally::debug::Level::Debug) {
    if (!::tally::debug::enabled(level))
        return;
    ::tally::debug::log(::tally::debug::Stage::Replay, level,
                        std::string(get(id)) + ": " + detail);
}

/// イベント位置をダンプ（Traceレベル）
inline void dump_event(size_t line_no, const std::string& directive) {
    if (!::tally::debug::enabled(::tally::debug::Level::Trace))
        return;
    ::tally::debug::log(::tally::debug::Stage::Replay, ::tally::debug::Level::Trace,
                        std::string(get(Id::Event)) + " @" + std::to_string(line_no) + ": " +
                            directive);
}

}  // namespace tally::debug::rpl
