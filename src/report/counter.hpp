#pragma once

// ============================================================
// Counter - パッケージ別・種別ごとの診断数と行数を集計
// ============================================================

#include "summary.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tally {
namespace report {

/// 最初に現れた順を保つ件数表
class OrderedCounts {
   public:
    /// key に amount を加算（初出なら末尾に追加）
    void add(const std::string& key, uint64_t amount = 1);

    /// 件数を取得（なければ0）
    uint64_t get(const std::string& key) const;

    bool contains(const std::string& key) const { return counts_.count(key) > 0; }

    const std::vector<std::string>& keys() const { return keys_; }
    size_t size() const { return keys_.size(); }
    bool empty() const { return keys_.empty(); }

   private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, uint64_t> counts_;
};

/// 集計行の識別子。nullopt はどのパッケージにも属さない単位
using PackageKey = std::optional<std::string>;

/// サマリーを1回辿って4つの集計を作るビジター
class Counter : public RecursiveSummaryVisitor {
   public:
    /// パッケージに属さない単位の行ラベル
    static constexpr const char* kOtherPackage = "*other*";

    /// 行ラベル（パッケージ名、または *other*）
    static std::string label(const PackageKey& package);

    void visit_global(const GlobalSummary& global) override;
    void visit_package(const PackageSummary& package) override;
    void visit_library(const LibrarySummary& library) override;
    void visit_html(const HtmlSummary& html) override;
    void visit_message(const MessageSummary& message) override;

    /// 最初に訪れた順の集計行
    const std::vector<PackageKey>& packages() const { return packages_; }

    /// 行の種別ごとの件数（なければ空）
    const OrderedCounts& error_count(const PackageKey& package) const;

    /// 行の行数（なければ0）
    uint64_t lines_of_code(const PackageKey& package) const;

    /// 種別 -> 全体の件数（最初に現れた順）
    const OrderedCounts& totals() const { return totals_; }

    uint64_t total_lines_of_code() const { return total_lines_of_code_; }

   private:
    // 現在の行を登録して返す
    void touch(const PackageKey& package);

    PackageKey current_package_;
    std::vector<PackageKey> packages_;
    std::map<PackageKey, OrderedCounts> error_count_;
    std::map<PackageKey, uint64_t> lines_of_code_;
    OrderedCounts totals_;
    uint64_t total_lines_of_code_ = 0;
};

}  // namespace report
}  // namespace tally
