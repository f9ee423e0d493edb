#pragma once

#include "../debug.hpp"

#include <string>

namespace tally::debug::rep {

/// レポーターのデバッグメッセージID
enum class Id {
    EnterLibrary,    // ライブラリ開始
    LeaveLibrary,    // ライブラリ終了
    EnterHtml,       // HTML開始
    LeaveHtml,       // HTML終了
    EnterUnit,       // コンパイル単位開始
    LeaveUnit,       // コンパイル単位終了
    Scope,           // スコープ判定
    LineCount,       // 行数を加算
    Message,         // メッセージ記録
    BelowThreshold,  // しきい値未満で破棄
    KindDisabled,    // 無効化された種別で破棄
    OrphanDropped,   // 対象単位なしで破棄
    OrphanRejected,  // 対象単位なしでエラー
    ClearLibrary,    // ライブラリのクリア
    ClearHtml,       // HTMLのクリア
    ClearAll         // 全体のクリア
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Entering library", "ライブラリに入る"},
    {"Leaving library", "ライブラリを出る"},
    {"Entering HTML unit", "HTML単位に入る"},
    {"Leaving HTML unit", "HTML単位を出る"},
    {"Entering compilation unit", "コンパイル単位に入る"},
    {"Leaving compilation unit", "コンパイル単位を出る"},
    {"Resolved scope", "スコープを判定"},
    {"Added line count", "行数を加算"},
    {"Recorded message", "メッセージを記録"},
    {"Dropped message below threshold", "しきい値未満のメッセージを破棄"},
    {"Dropped message of disabled kind", "無効化された種別のメッセージを破棄"},
    {"Dropped message without current unit", "対象単位のないメッセージを破棄"},
    {"Rejected message without current unit", "対象単位のないメッセージを拒否"},
    {"Clearing library", "ライブラリをクリア"},
    {"Clearing HTML unit", "HTML単位をクリア"},
    {"Clearing whole summary", "サマリー全体をクリア"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::tally::debug::g_lang];
}

inline void log(Id id, ::tally::debug::Level level = ::tally::debug::Level::Debug) {
    if (!::tally::debug::enabled(level))
        return;
    ::tally::debug::log(::tally::debug::Stage::Reporter, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::tally::debug::Level level = ::tally::debug::Level::Debug) {
    if (!::tally::debug::enabled(level))
        return;
    ::tally::debug::log(::tally::debug::Stage::Reporter, level,
                        std::string(get(id)) + ": " + detail);
}

}  // namespace tally::debug::rep
