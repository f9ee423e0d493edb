#pragma once

// ============================================================
// 診断の重大度
// ============================================================

#include <optional>
#include <string>

namespace tally {
namespace report {

/// 重大度（値が大きいほど重い）
enum class Severity {
    All = 0,         // しきい値専用: すべて記録
    Help = 1,        // 修正方法の提案
    Note = 2,        // 補足情報
    Hint = 3,        // ベストプラクティス
    Suggestion = 4,  // スタイル違反、改善提案
    Warning = 5,     // 未使用変数、到達不可能コードなど
    Error = 6        // 構文エラー、型エラーなど
};

/// 重大度を文字列に変換（小文字）
inline const char* severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::All:
            return "all";
        case Severity::Help:
            return "help";
        case Severity::Note:
            return "note";
        case Severity::Hint:
            return "hint";
        case Severity::Suggestion:
            return "suggestion";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "unknown";
}

/// 文字列から重大度を解析
inline std::optional<Severity> parse_severity(const std::string& text) {
    if (text == "all")
        return Severity::All;
    if (text == "help")
        return Severity::Help;
    if (text == "note")
        return Severity::Note;
    if (text == "hint")
        return Severity::Hint;
    if (text == "suggestion")
        return Severity::Suggestion;
    if (text == "warning")
        return Severity::Warning;
    if (text == "error")
        return Severity::Error;
    return std::nullopt;
}

/// しきい値以上か
inline bool is_at_least(Severity severity, Severity threshold) {
    return static_cast<int>(severity) >= static_cast<int>(threshold);
}

}  // namespace report
}  // namespace tally
