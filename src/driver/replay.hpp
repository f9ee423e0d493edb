#pragma once

// ============================================================
// TraceReplayer - 記録されたイベント列をレポーターへ再生
// ============================================================
// 1行1イベント。'#' 以降の行と空行は無視する。
//
//   enter-library <uri>     leave-library
//   enter-html <uri>        leave-html
//   enter-unit <path>       leave-unit
//   lines <n>
//   log <Kind> <severity> <begin> <end> <text...>
//   clear-library <uri>     clear-html <uri>     clear-all
// ============================================================

#include "common/source.hpp"
#include "report/reporter.hpp"

#include <filesystem>
#include <istream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tally {
namespace driver {

/// トレースの書式エラー（行番号付き）
class ReplayError : public std::runtime_error {
   public:
    ReplayError(size_t line, const std::string& message);

    size_t line() const { return line_; }

   private:
    size_t line_;
};

/// 再生結果
struct ReplayStats {
    size_t events = 0;
    size_t messages = 0;
    size_t units = 0;  // enter-library / enter-html の回数
};

class TraceReplayer {
   public:
    /// base_dir は enter-unit の相対パスの基準
    explicit TraceReplayer(report::CompilerReporter& reporter,
                           std::filesystem::path base_dir = std::filesystem::path());

    /// ストリームから再生
    ReplayStats replay(std::istream& in);

    /// ファイルから再生（基準ディレクトリはファイルの親）
    ReplayStats replay_file(const std::string& path);

   private:
    void dispatch(size_t line_no, const std::string& directive, std::istringstream& args);

    void enter_unit(size_t line_no, const std::string& path);
    void leave_unit();

    report::CompilerReporter& reporter_;
    std::filesystem::path base_dir_;
    std::unique_ptr<Source> source_;  // 現在のコンパイル単位
    ReplayStats stats_;
};

}  // namespace driver
}  // namespace tally
