#pragma once

// ============================================================
// レポーター - 解析ドライバからの通知を受け取る
// ============================================================

#include "common/source.hpp"
#include "levels.hpp"
#include "summary.hpp"
#include "unit_id.hpp"

#include <cstdint>
#include <set>
#include <string>

namespace tally {
namespace report {

/// 解析器が報告する診断1件（オフセットは現在のコンパイル単位内）
struct Message {
    std::string kind;  // 診断の種別
    Severity level = Severity::Error;
    uint32_t begin = 0;
    uint32_t end = 0;
    std::string text;
};

/// チェッカーからメッセージを受け取るインターフェース
class CheckerReporter {
   public:
    virtual ~CheckerReporter() = default;

    virtual void log(const Message& message) = 0;
};

/// コンパイラドライバからの通知インターフェース
class CompilerReporter : public CheckerReporter {
   public:
    /// ライブラリの処理開始/終了
    virtual void enter_library(const std::string& uri) = 0;
    virtual void leave_library() = 0;

    /// HTMLファイルの処理開始/終了
    virtual void enter_html(const std::string& uri) = 0;
    virtual void leave_html() = 0;

    /// コンパイル単位の処理開始。以降のメッセージのオフセットはこのソース内の位置。
    /// source は leave_compilation_unit() まで生存していること。
    virtual void enter_compilation_unit(const Source& source) { source_ = &source; }
    virtual void leave_compilation_unit() { source_ = nullptr; }

    /// 現在の単位に行数を加算
    virtual void record_line_count(uint64_t) {}

    // サーバーモード（再解析）用
    virtual void clear_library(const std::string& uri) = 0;
    virtual void clear_html(const std::string& uri) = 0;
    virtual void clear_all() = 0;

   protected:
    /// 現在のソースでオフセットを位置情報に解決
    SourceLocation create_location(const Message& message, const std::string& fallback_file) const;

    const Source* source_ = nullptr;
};

/// 対象単位がないときの log の扱い
enum class MissingUnitPolicy {
    Error,  // NoCurrentUnitError を投げる
    Drop    // 黙って破棄
};

/// SummaryReporter の設定
struct ReportOptions {
    Severity min_level = Severity::All;  // これ未満のメッセージは記録しない
    MissingUnitPolicy missing_unit = MissingUnitPolicy::Error;
    std::set<std::string> disabled_kinds;
    ScopeRules scope_rules;
};

/// サマリー内の単位への参照。clear_all() で無効になる。
class UnitHandle {
   public:
    UnitHandle() = default;

    explicit operator bool() const { return unit_ != nullptr; }

    IndividualSummary* get() const { return unit_; }

    /// ライブラリなら行数を扱える
    LibrarySummary* library() const { return dynamic_cast<LibrarySummary*>(unit_); }

    bool operator==(const UnitHandle& other) const { return unit_ == other.unit_; }

   private:
    friend class SummaryReporter;
    explicit UnitHandle(IndividualSummary* unit) : unit_(unit) {}

    IndividualSummary* unit_ = nullptr;
};

/// 全ての情報を GlobalSummary に集めるレポーター
class SummaryReporter : public CompilerReporter {
   public:
    explicit SummaryReporter(ReportOptions options = ReportOptions{});

    // ========================================
    // ハンドルAPI（現在の単位を変更しない）
    // ========================================

    /// ライブラリを取得（なければ作成）
    UnitHandle open_library(const std::string& uri);

    /// HTML単位を取得（なければ loose に作成）
    UnitHandle open_html(const std::string& uri);

    /// 指定単位にメッセージを記録
    void record(UnitHandle unit, const Message& message, const Source* source = nullptr);

    /// 指定単位に行数を加算（HTML単位では何もしない）
    void add_lines(UnitHandle unit, uint64_t lines);

    // ========================================
    // CompilerReporter
    // ========================================

    void enter_library(const std::string& uri) override;
    void leave_library() override;
    void enter_html(const std::string& uri) override;
    void leave_html() override;
    void enter_compilation_unit(const Source& source) override;
    void leave_compilation_unit() override;
    void record_line_count(uint64_t lines) override;
    void log(const Message& message) override;
    void clear_library(const std::string& uri) override;
    void clear_html(const std::string& uri) override;
    void clear_all() override;

    /// 現在の単位
    UnitHandle current() const { return current_; }

    const GlobalSummary& result() const { return result_; }
    const ReportOptions& options() const { return options_; }

   private:
    // しきい値・無効化種別によるフィルタ
    bool accepts(const Message& message) const;

    ReportOptions options_;
    GlobalSummary result_;
    UnitHandle current_;
};

}  // namespace report
}  // namespace tally
