#include "../../src/driver/replay.hpp"

#include "../../src/report/errors.hpp"
#include "../../src/report/report.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace tally;
using namespace tally::driver;
using namespace tally::report;

namespace fs = std::filesystem;

// ============================================================
// テストヘルパー
// ============================================================
class TraceReplayerTest : public ::testing::Test {
   protected:
    ReplayStats run(const std::string& trace) {
        std::istringstream in(trace);
        TraceReplayer replayer(reporter);
        return replayer.replay(in);
    }

    size_t error_line(const std::string& trace) {
        try {
            run(trace);
        } catch (const ReplayError& e) {
            return e.line();
        }
        ADD_FAILURE() << "expected ReplayError";
        return 0;
    }

    SummaryReporter reporter;
};

// ============================================================
// 正常系
// ============================================================
TEST_F(TraceReplayerTest, ReplaysSession) {
    auto stats = run(
        "# 解析セッション\n"
        "enter-library package:p/p.dart\n"
        "lines 10\n"
        "log TypeError error 0 4 bad type\n"
        "log TypeError warning 5 9 another one\n"
        "leave-library\n"
        "\n"
        "enter-library dart:core\n"
        "lines 5\n"
        "log TypeError error 0 1 core\n"
        "leave-library\n");

    EXPECT_EQ(stats.events, 9u);
    EXPECT_EQ(stats.messages, 3u);
    EXPECT_EQ(stats.units, 2u);

    const auto& lib = reporter.result().packages.at("p").libraries.at("package:p/p.dart");
    EXPECT_EQ(lib.lines, 10u);
    ASSERT_EQ(lib.messages.size(), 2u);
    EXPECT_EQ(lib.messages[0].text, "bad type");
    EXPECT_EQ(lib.messages[1].severity, "warning");
    EXPECT_EQ(lib.messages[1].text, "another one");
    EXPECT_NE(summary_to_string(reporter.result()).find("20.00"), std::string::npos);
}

TEST_F(TraceReplayerTest, HtmlAndClearDirectives) {
    run("enter-html file:///index.html\n"
        "log HtmlError error 0 0 bad tag\n"
        "leave-html\n"
        "clear-html file:///index.html\n"
        "enter-library dart:core\n"
        "lines 3\n"
        "leave-library\n"
        "clear-library dart:core\n");

    EXPECT_TRUE(reporter.result().loose.at("file:///index.html")->messages.empty());
    EXPECT_EQ(reporter.result().system.at("dart:core").lines, 0u);

    run("clear-all\n");
    EXPECT_TRUE(reporter.result().empty());
}

TEST_F(TraceReplayerTest, CarriageReturnsAreStripped) {
    run("enter-library dart:core\r\n"
        "log TypeError error 0 0 text\r\n");
    const auto& msgs = reporter.result().system.at("dart:core").messages;
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0].text, "text");
}

TEST_F(TraceReplayerTest, MessageWithoutText) {
    run("enter-library dart:core\n"
        "log TypeError error 0 0\n");
    EXPECT_EQ(reporter.result().system.at("dart:core").messages.at(0).text, "");
}

// ============================================================
// 書式エラー
// ============================================================
TEST_F(TraceReplayerTest, ErrorsCarryLineNumbers) {
    EXPECT_EQ(error_line("bogus\n"), 1u);
    EXPECT_EQ(error_line("# c\n\nenter-library\n"), 3u);
    EXPECT_EQ(error_line("enter-library dart:core\nlines ten\n"), 2u);
    EXPECT_EQ(error_line("enter-library dart:core\nlines -1\n"), 2u);
    EXPECT_EQ(error_line("enter-library dart:core\nlog TypeError loud 0 0 x\n"), 2u);
    EXPECT_EQ(error_line("enter-library dart:core\nlog TypeError all 0 0 x\n"), 2u);
    EXPECT_EQ(error_line("enter-library dart:core\nlog TypeError error x 0 t\n"), 2u);
    EXPECT_EQ(error_line("enter-library dart:core\nlog TypeError error 0\n"), 2u);
}

TEST_F(TraceReplayerTest, ErrorMessageNamesDirective) {
    try {
        run("frobnicate now\n");
        FAIL() << "expected ReplayError";
    } catch (const ReplayError& e) {
        EXPECT_EQ(std::string(e.what()), "[REPLAY] line 1: unknown directive 'frobnicate'");
    }
}

TEST_F(TraceReplayerTest, ReporterErrorsPropagate) {
    EXPECT_THROW(run("log TypeError error 0 0 orphan\n"), NoCurrentUnitError);
}

TEST_F(TraceReplayerTest, MissingTraceFile) {
    TraceReplayer replayer(reporter);
    try {
        replayer.replay_file("/nonexistent/trace.txt");
        FAIL() << "expected ReplayError";
    } catch (const ReplayError& e) {
        EXPECT_EQ(e.line(), 0u);
    }
}

// ============================================================
// コンパイル単位
// ============================================================
class TraceReplayerFileTest : public TraceReplayerTest {
   protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("tally_replay_test_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_ / "lib");
        write("lib/a.dart", "library a;\nvoid main() {}\n");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream out(dir_ / name);
        out << content;
    }

    fs::path dir_;
};

TEST_F(TraceReplayerFileTest, EnterUnitResolvesRelativeToTrace) {
    write("trace.txt",
          "enter-library package:a/a.dart\n"
          "enter-unit lib/a.dart\n"
          "log TypeError error 16 20 bad main\n"
          "leave-unit\n"
          "leave-library\n");

    TraceReplayer replayer(reporter);
    auto stats = replayer.replay_file((dir_ / "trace.txt").string());
    EXPECT_EQ(stats.messages, 1u);

    const auto& lib = reporter.result().packages.at("a").libraries.at("package:a/a.dart");
    EXPECT_EQ(lib.lines, 2u);
    const auto& loc = lib.messages.at(0).location;
    EXPECT_EQ(loc.file, "lib/a.dart");
    EXPECT_EQ(loc.begin.line, 2u);
    EXPECT_EQ(loc.begin.column, 6u);
}

TEST_F(TraceReplayerFileTest, UnitIsReleasedAtEndOfTrace) {
    std::istringstream in(
        "enter-library package:a/a.dart\n"
        "enter-unit lib/a.dart\n");
    TraceReplayer replayer(reporter, dir_);
    replayer.replay(in);

    // ソースが外れているので位置は解決されない
    reporter.log(Message{"Late", Severity::Error, 0, 1, "after replay"});
    const auto& lib = reporter.result().packages.at("a").libraries.at("package:a/a.dart");
    EXPECT_FALSE(lib.messages.back().location.is_resolved());
}

TEST_F(TraceReplayerFileTest, MissingSourceFile) {
    std::istringstream in(
        "enter-library package:a/a.dart\n"
        "enter-unit lib/missing.dart\n");
    TraceReplayer replayer(reporter, dir_);
    try {
        replayer.replay(in);
        FAIL() << "expected ReplayError";
    } catch (const ReplayError& e) {
        EXPECT_EQ(e.line(), 2u);
        EXPECT_NE(std::string(e.what()).find("cannot open source file"), std::string::npos);
    }
}
