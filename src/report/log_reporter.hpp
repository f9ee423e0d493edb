#pragma once

// ============================================================
// LogReporter - メッセージを受け取った順に出力する
// ============================================================

#include "reporter.hpp"

#include <iostream>
#include <string>

namespace tally {
namespace report {

/// 整形済み診断の出力先
class DiagnosticSink {
   public:
    virtual ~DiagnosticSink() = default;

    virtual void write(Severity severity, const std::string& text) = 0;
};

/// ストリームへ書き出す出力先
class StreamSink : public DiagnosticSink {
   public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    void write(Severity, const std::string& text) override { out_ << text; }

   private:
    std::ostream& out_;
};

/// チェッカーのメッセージを見つけた順にシンクへ書き出すレポーター
class LogReporter : public CompilerReporter {
   public:
    explicit LogReporter(DiagnosticSink& sink, Severity min_level = Severity::All)
        : sink_(sink), min_level_(min_level) {}

    void enter_library(const std::string& uri) override { current_ = uri; }
    void leave_library() override { current_.clear(); }

    void enter_html(const std::string& uri) override { current_ = uri; }
    void leave_html() override { current_.clear(); }

    void log(const Message& message) override;

    void clear_library(const std::string&) override {}
    void clear_html(const std::string&) override {}
    void clear_all() override {}

    /// 1件分の出力を整形
    std::string format(const Message& message) const;

   private:
    DiagnosticSink& sink_;
    Severity min_level_;
    std::string current_;  // ソースがない場合のファイル名
};

}  // namespace report
}  // namespace tally
