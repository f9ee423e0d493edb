#pragma once

#include "summary.hpp"

#include <cstdint>
#include <string>

namespace tally {
namespace report {

/// 常に先頭に置く診断種別の列
inline constexpr const char* kAnalyzerErrorKind = "AnalyzerError";

/// サマリーを表形式の文字列に変換
///
/// 列: package, AnalyzerError, 出現した種別（初出順）, LinesOfCode
/// 行: パッケージごとの件数、合計、行数に対する百分率
///
/// 表の構築に失敗した場合は ReportError を投げる（部分的な出力はしない）。
std::string summary_to_string(const GlobalSummary& summary);

/// count * 100 / total を小数点以下2桁で整形（total が0なら "0.00"）
std::string format_percent(uint64_t count, uint64_t total);

}  // namespace report
}  // namespace tally
