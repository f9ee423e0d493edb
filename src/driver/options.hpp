#pragma once

// ============================================================
// コマンドラインオプション - 設定ファイルとの統合
// ============================================================

#include "report/reporter.hpp"

#include <string>

namespace tally {
namespace driver {

// コマンド
enum class Command { None, Report, Log, Help };

// コマンドラインオプション
struct Options {
    Command command = Command::None;
    std::string input_file;
    std::string output_file;  // -o オプション
    std::string config_file;  // --config=<path>
    std::string config_search_dir = ".";  // --config 省略時の探索開始位置
    std::string level;                    // --level=<severity>
    bool drop_orphans = false;
    bool debug = false;
    std::string debug_level = "info";
    bool verbose = false;
};

/// 設定ファイルを読み、コマンドラインの指定で上書きした集計設定を作る。
/// 失敗時は false を返し、error に理由を入れる。
bool build_report_options(const Options& opts, report::ReportOptions& out, std::string& error);

}  // namespace driver
}  // namespace tally
