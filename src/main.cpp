#include "common/debug_messages.hpp"
#include "driver/options.hpp"
#include "driver/replay.hpp"
#include "report/log_reporter.hpp"
#include "report/report.hpp"
#include "report/reporter.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace tally {

constexpr const char* kVersion = "0.3.0";

using driver::Command;
using driver::Options;

// ヘルプメッセージを表示
void print_help(const char* program_name) {
    std::cout << "tally 診断サマリー v" << kVersion << "\n\n";
    std::cout << "使用方法:\n";
    std::cout << "  " << program_name << " <コマンド> [オプション] <トレース>\n\n";
    std::cout << "コマンド:\n";
    std::cout << "  report <trace>        トレースを集計して表を表示\n";
    std::cout << "  log <trace>           トレースのメッセージを順に表示\n";
    std::cout << "  help                  このヘルプを表示\n\n";
    std::cout << "オプション:\n";
    std::cout << "  -o <file>             レポートの出力ファイル名を指定\n";
    std::cout << "  --level=<severity>    記録する最小の重大度\n";
    std::cout << "                        (all/help/note/hint/suggestion/warning/error)\n";
    std::cout << "  --config=<path>       設定ファイル（省略時は .tallyconfig.yml を探索）\n";
    std::cout << "  --drop-orphans        単位外のメッセージをエラーにせず破棄\n";
    std::cout << "  --verbose, -v         詳細な出力を表示\n";
    std::cout << "  --debug, -d           デバッグ出力を有効化\n";
    std::cout << "  -d=<level>            デバッグレベル（trace/debug/info/warn/error）\n";
    std::cout << "  --lang=ja             日本語デバッグメッセージ\n";
    std::cout << "  --version             バージョン情報を表示\n\n";
    std::cout << "例:\n";
    std::cout << "  " << program_name << " report build/analysis.trace\n";
    std::cout << "  " << program_name << " report --level=warning -o summary.txt a.trace\n";
    std::cout << "  " << program_name << " log a.trace\n";
}

// コマンドラインオプションをパース
Options parse_options(int argc, char* argv[]) {
    Options opts;

    if (argc < 2) {
        return opts;  // コマンドなし
    }

    // 最初の引数でコマンドを判定
    std::string cmd = argv[1];
    if (cmd == "report") {
        opts.command = Command::Report;
    } else if (cmd == "log") {
        opts.command = Command::Log;
    } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        opts.command = Command::Help;
        return opts;
    } else if (cmd == "--version") {
        std::cout << "tally v" << kVersion << "\n";
        std::exit(0);
    } else {
        std::cerr << "不明なコマンド: " << cmd << "\n";
        std::cerr << "'tally help' でヘルプを表示\n";
        std::exit(1);
    }

    // 残りの引数を処理
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "-o") {
            if (i + 1 < argc) {
                opts.output_file = argv[++i];
            } else {
                std::cerr << "-o オプションには出力ファイル名が必要です\n";
                std::exit(1);
            }
        } else if (arg.starts_with("--level=")) {
            opts.level = arg.substr(8);
        } else if (arg.starts_with("--config=")) {
            opts.config_file = arg.substr(9);
        } else if (arg == "--drop-orphans") {
            opts.drop_orphans = true;
        } else if (arg == "--debug" || arg == "-d") {
            opts.debug = true;
            debug::set_debug_mode(true);
        } else if (arg.starts_with("-d=")) {
            opts.debug = true;
            opts.debug_level = arg.substr(3);
            debug::set_debug_mode(true);
            debug::set_level(debug::parse_level(opts.debug_level));
        } else if (arg == "--lang=ja") {
            debug::set_lang(1);
        } else if (arg[0] != '-') {
            if (opts.input_file.empty()) {
                opts.input_file = arg;
            } else {
                std::cerr << "複数の入力ファイルは指定できません\n";
                std::exit(1);
            }
        } else {
            std::cerr << "不明なオプション: " << arg << "\n";
            std::cerr << "'tally help' でヘルプを表示\n";
            std::exit(1);
        }
    }

    return opts;
}

}  // namespace tally

int main(int argc, char* argv[]) {
    using namespace tally;

    // オプションをパース
    Options opts = parse_options(argc, argv);

    if (opts.command == Command::Help) {
        print_help(argv[0]);
        return 0;
    }

    if (opts.command == Command::None || opts.input_file.empty()) {
        if (argc == 1) {
            std::cerr << "エラー: コマンドが指定されていません\n";
            std::cerr << "'tally help' でヘルプを表示\n";
        } else {
            std::cerr << "エラー: トレースファイルが指定されていません\n";
        }
        return 1;
    }

    report::ReportOptions report_opts;
    std::string options_error;
    if (!driver::build_report_options(opts, report_opts, options_error)) {
        std::cerr << "エラー: " << options_error << "\n";
        return 1;
    }

    try {
        if (opts.command == Command::Log) {
            report::StreamSink sink(std::cout);
            report::LogReporter reporter(sink, report_opts.min_level);
            driver::TraceReplayer replayer(reporter);
            auto stats = replayer.replay_file(opts.input_file);
            if (opts.verbose) {
                std::cout << "✓ " << stats.messages << " 件のメッセージを表示しました\n";
            }
            return 0;
        }

        // ========== Replay ==========
        report::SummaryReporter reporter(report_opts);
        driver::TraceReplayer replayer(reporter);
        auto stats = replayer.replay_file(opts.input_file);
        if (opts.verbose) {
            std::cout << "イベント数: " << stats.events << ", 単位数: " << stats.units
                      << ", メッセージ数: " << stats.messages << "\n\n";
        }

        // ========== Report ==========
        std::string text = report::summary_to_string(reporter.result());
        if (opts.output_file.empty()) {
            std::cout << text;
        } else {
            std::ofstream out(opts.output_file);
            if (!out.is_open()) {
                std::cerr << "エラー: 出力ファイルを開けません: " << opts.output_file << "\n";
                return 1;
            }
            out << text;
            if (opts.verbose) {
                std::cout << "✓ レポートを書き出しました: " << opts.output_file << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "エラー: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
