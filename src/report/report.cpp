#include "report.hpp"

#include "counter.hpp"
#include "table.hpp"

#include <fmt/format.h>

#include <vector>

namespace tally {
namespace report {

std::string format_percent(uint64_t count, uint64_t total) {
    if (total == 0) {
        return "0.00";
    }
    return fmt::format("{:.2f}", static_cast<double>(count) * 100.0 / static_cast<double>(total));
}

std::string summary_to_string(const GlobalSummary& summary) {
    Counter counter;
    summary.accept(counter);

    // AnalyzerError は固定列なので重複させない
    std::vector<std::string> kinds;
    for (const auto& kind : counter.totals().keys()) {
        if (kind != kAnalyzerErrorKind) {
            kinds.push_back(kind);
        }
    }

    Table table;
    table.declare_column("package");
    table.declare_column(kAnalyzerErrorKind, true);
    for (const auto& kind : kinds) {
        table.declare_column(kind, true);
    }
    table.declare_column("LinesOfCode", true);
    table.add_header();

    // パッケージごとの行
    for (const auto& package : counter.packages()) {
        const OrderedCounts& counts = counter.error_count(package);
        table.add_entry(Counter::label(package));
        table.add_entry(counts.get(kAnalyzerErrorKind));
        for (const auto& kind : kinds) {
            table.add_entry(counts.get(kind));
        }
        table.add_entry(counter.lines_of_code(package));
    }

    // 合計・百分率と、見やすさのための見出しを再度
    table.add_divider();
    table.add_header();
    table.add_entry("total");
    table.add_entry(counter.totals().get(kAnalyzerErrorKind));
    for (const auto& kind : kinds) {
        table.add_entry(counter.totals().get(kind));
    }
    table.add_entry(counter.total_lines_of_code());

    uint64_t total_loc = counter.total_lines_of_code();
    table.add_entry("%");
    table.add_entry(format_percent(counter.totals().get(kAnalyzerErrorKind), total_loc));
    for (const auto& kind : kinds) {
        table.add_entry(format_percent(counter.totals().get(kind), total_loc));
    }
    table.add_entry(100);

    return table.to_string();
}

}  // namespace report
}  // namespace tally
