#pragma once

// ============================================================
// レポート処理のエラー
// ============================================================

#include <stdexcept>
#include <string>

namespace tally {
namespace report {

/// レポート処理の致命的エラー
class ReportError : public std::runtime_error {
   public:
    enum class Kind {
        NO_CURRENT_UNIT,
        MALFORMED_TABLE,
        SCHEMA_FROZEN,
    };

    ReportError(Kind kind, const std::string& message)
        : std::runtime_error(format_error(kind, message)), kind_(kind) {}

    Kind kind() const { return kind_; }

   private:
    Kind kind_;

    static std::string format_error(Kind kind, const std::string& message);
};

/// 対象単位がないままメッセージが報告された
class NoCurrentUnitError : public ReportError {
   public:
    explicit NoCurrentUnitError(const std::string& message)
        : ReportError(Kind::NO_CURRENT_UNIT, message) {}
};

/// 列数の倍数でない要素数など、不正な表
class MalformedTableError : public ReportError {
   public:
    explicit MalformedTableError(const std::string& message)
        : ReportError(Kind::MALFORMED_TABLE, message) {}
};

/// データ追加後の列宣言
class SchemaFrozenError : public ReportError {
   public:
    explicit SchemaFrozenError(const std::string& message)
        : ReportError(Kind::SCHEMA_FROZEN, message) {}
};

}  // namespace report
}  // namespace tally
