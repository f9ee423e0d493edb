#pragma once

#include <iostream>
#include <string>

namespace tally::debug {

/// デバッグモードフラグ
inline bool g_debug_mode = false;

/// 言語設定 (0=English, 1=Japanese)
inline int g_lang = 0;

/// デバッグレベル
enum class Level { Trace, Debug, Info, Warn, Error };

/// 現在のデバッグレベル
inline Level g_debug_level = Level::Debug;

/// 処理段階
enum class Stage { Reporter, Counter, Table, Config, Replay };

/// 段階を文字列に変換
inline const char* stage_str(Stage s) {
    switch (s) {
        case Stage::Reporter:
            return "REPORTER";
        case Stage::Counter:
            return "COUNTER";
        case Stage::Table:
            return "TABLE";
        case Stage::Config:
            return "CONFIG";
        case Stage::Replay:
            return "REPLAY";
    }
    return "UNKNOWN";
}

/// レベルを文字列に変換
inline const char* level_str(Level l) {
    switch (l) {
        case Level::Trace:
            return "TRACE";
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

/// 出力するかどうか
inline bool enabled(Level level) {
    return g_debug_mode && level >= g_debug_level;
}

/// デバッグ出力
inline void log(Stage stage, Level level, const char* msg) {
    if (!enabled(level))
        return;
    const char* prefix = "";
    switch (level) {
        case Level::Error: prefix = "ERROR: "; break;
        case Level::Warn: prefix = "WARN: "; break;
        default: break;
    }
    std::cerr << "[" << stage_str(stage) << "] " << prefix << msg << std::endl;
}

inline void log(Stage stage, Level level, const std::string& msg) {
    log(stage, level, msg.c_str());
}

/// 設定関数
inline void set_debug_mode(bool enabled) {
    g_debug_mode = enabled;
}
inline void set_lang(int lang) {
    g_lang = lang;
}
inline void set_level(Level level) {
    g_debug_level = level;
}

/// レベル解析
inline Level parse_level(const std::string& s) {
    if (s == "trace")
        return Level::Trace;
    if (s == "debug")
        return Level::Debug;
    if (s == "info")
        return Level::Info;
    if (s == "warn")
        return Level::Warn;
    if (s == "error")
        return Level::Error;
    return Level::Debug;
}

}  // namespace tally::debug
