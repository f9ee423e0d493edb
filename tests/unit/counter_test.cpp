#include "../../src/report/counter.hpp"

#include <gtest/gtest.h>

using namespace tally;
using namespace tally::report;

namespace {

void add_message(IndividualSummary& unit, const std::string& kind) {
    unit.messages.emplace_back(kind, "error", SourceLocation{}, kind + " text");
}

// 集計行のラベル一覧
std::vector<std::string> row_labels(const Counter& counter) {
    std::vector<std::string> labels;
    for (const auto& package : counter.packages()) {
        labels.push_back(Counter::label(package));
    }
    return labels;
}

}  // namespace

// ============================================================
// OrderedCounts
// ============================================================
TEST(OrderedCountsTest, KeepsFirstSeenOrder) {
    OrderedCounts counts;
    counts.add("b");
    counts.add("a", 3);
    counts.add("b", 2);

    std::vector<std::string> expected = {"b", "a"};
    EXPECT_EQ(counts.keys(), expected);
    EXPECT_EQ(counts.get("b"), 3u);
    EXPECT_EQ(counts.get("a"), 3u);
    EXPECT_EQ(counts.get("missing"), 0u);
    EXPECT_FALSE(counts.contains("missing"));
}

TEST(OrderedCountsTest, ZeroAmountStillRegistersKey) {
    OrderedCounts counts;
    counts.add("x", 0);
    EXPECT_TRUE(counts.contains("x"));
    EXPECT_EQ(counts.size(), 1u);
    EXPECT_EQ(counts.get("x"), 0u);
}

// ============================================================
// Counter
// ============================================================
class CounterTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto& core = global.system_library("dart:core");
        core.lines = 5;
        add_message(core, "TypeError");

        auto& lib = global.package("p").library("package:p/p.dart");
        lib.lines = 10;
        add_message(lib, "TypeError");
        add_message(lib, "TypeError");
        add_message(lib, "DeadCode");

        auto& html = global.loose_unit<HtmlSummary>("file:///index.html");
        add_message(html, "HtmlError");

        global.accept(counter);
    }

    GlobalSummary global;
    Counter counter;
};

TEST_F(CounterTest, NonPackageUnitsGoToOther) {
    std::vector<std::string> expected = {"*other*", "p"};
    EXPECT_EQ(row_labels(counter), expected);
    EXPECT_FALSE(counter.packages()[0].has_value());

    const auto& other = counter.error_count(std::nullopt);
    EXPECT_EQ(other.get("TypeError"), 1u);
    EXPECT_EQ(other.get("HtmlError"), 1u);
    EXPECT_EQ(other.get("DeadCode"), 0u);
}

TEST_F(CounterTest, PerPackageCounts) {
    const auto& p = counter.error_count("p");
    EXPECT_EQ(p.get("TypeError"), 2u);
    EXPECT_EQ(p.get("DeadCode"), 1u);
    EXPECT_EQ(p.get("HtmlError"), 0u);
}

TEST_F(CounterTest, TotalsFollowTraversalOrder) {
    std::vector<std::string> expected = {"TypeError", "DeadCode", "HtmlError"};
    EXPECT_EQ(counter.totals().keys(), expected);
    EXPECT_EQ(counter.totals().get("TypeError"), 3u);
    EXPECT_EQ(counter.totals().get("DeadCode"), 1u);
    EXPECT_EQ(counter.totals().get("HtmlError"), 1u);
}

TEST_F(CounterTest, TotalsEqualSumOverPackages) {
    for (const auto& kind : counter.totals().keys()) {
        uint64_t sum = 0;
        for (const auto& package : counter.packages()) {
            sum += counter.error_count(package).get(kind);
        }
        EXPECT_EQ(sum, counter.totals().get(kind)) << kind;
    }
}

TEST_F(CounterTest, LinesOfCode) {
    EXPECT_EQ(counter.lines_of_code(std::nullopt), 5u);
    EXPECT_EQ(counter.lines_of_code("p"), 10u);
    EXPECT_EQ(counter.total_lines_of_code(), 15u);
}

TEST(CounterEdgeTest, EmptySummary) {
    GlobalSummary global;
    Counter counter;
    global.accept(counter);

    EXPECT_TRUE(counter.packages().empty());
    EXPECT_TRUE(counter.totals().empty());
    EXPECT_EQ(counter.total_lines_of_code(), 0u);
    EXPECT_TRUE(counter.error_count("anything").empty());
}

TEST(CounterEdgeTest, PackageWithoutMessagesStillHasRow) {
    GlobalSummary global;
    global.package("quiet").library("package:quiet/q.dart").lines = 7;

    Counter counter;
    global.accept(counter);

    std::vector<std::string> expected = {"quiet"};
    EXPECT_EQ(row_labels(counter), expected);
    EXPECT_EQ(counter.lines_of_code("quiet"), 7u);
    EXPECT_TRUE(counter.error_count("quiet").empty());
}

TEST(CounterEdgeTest, PackagesAreVisitedInNameOrder) {
    GlobalSummary global;
    global.package("zeta").library("package:zeta/z.dart");
    global.package("alpha").library("package:alpha/a.dart");

    Counter counter;
    global.accept(counter);

    std::vector<std::string> expected = {"alpha", "zeta"};
    EXPECT_EQ(row_labels(counter), expected);
}

TEST(CounterEdgeTest, PackageNamedOtherKeepsItsOwnRow) {
    GlobalSummary global;
    auto& core = global.system_library("dart:core");
    core.lines = 5;
    add_message(core, "TypeError");
    auto& odd = global.package("*other*").library("package:*other*/x.dart");
    odd.lines = 3;
    add_message(odd, "TypeError");

    Counter counter;
    global.accept(counter);

    ASSERT_EQ(counter.packages().size(), 2u);
    EXPECT_FALSE(counter.packages()[0].has_value());
    EXPECT_EQ(counter.packages()[1], PackageKey("*other*"));
    EXPECT_EQ(counter.lines_of_code(std::nullopt), 5u);
    EXPECT_EQ(counter.lines_of_code("*other*"), 3u);
    EXPECT_EQ(counter.error_count(std::nullopt).get("TypeError"), 1u);
    EXPECT_EQ(counter.error_count("*other*").get("TypeError"), 1u);
}
