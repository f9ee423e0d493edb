#pragma once

// ============================================================
// サマリーツリー - 診断結果の階層モデル
// ============================================================
// GlobalSummary
//   ├─ system   : 識別子 -> LibrarySummary
//   ├─ packages : パッケージ名 -> PackageSummary -> LibrarySummary
//   └─ loose    : 識別子 -> LibrarySummary | HtmlSummary
// 各単位はメッセージ列を所有する。共有や循環はない。
// ============================================================

#include "common/span.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tally {
namespace report {

class SummaryVisitor;

/// 報告された診断1件
struct MessageSummary {
    std::string kind;      // 診断の種別（例: "TypeError"）
    std::string severity;  // 小文字の重大度
    SourceLocation location;
    std::string text;

    MessageSummary(std::string kind_, std::string severity_, SourceLocation location_,
                   std::string text_)
        : kind(std::move(kind_)),
          severity(std::move(severity_)),
          location(std::move(location_)),
          text(std::move(text_)) {}

    void accept(SummaryVisitor& visitor) const;
};

/// 単位1つ分のサマリー（ライブラリまたはHTML）
struct IndividualSummary {
    std::string name;
    std::vector<MessageSummary> messages;

    virtual ~IndividualSummary() = default;

    virtual void accept(SummaryVisitor& visitor) const = 0;

   protected:
    explicit IndividualSummary(std::string name_) : name(std::move(name_)) {}
    IndividualSummary(const IndividualSummary&) = default;
    IndividualSummary(IndividualSummary&&) = default;
    IndividualSummary& operator=(const IndividualSummary&) = default;
    IndividualSummary& operator=(IndividualSummary&&) = default;
};

/// ライブラリ単位（行数を持つ）
struct LibrarySummary : IndividualSummary {
    uint64_t lines = 0;

    explicit LibrarySummary(std::string name_) : IndividualSummary(std::move(name_)) {}

    void accept(SummaryVisitor& visitor) const override;
};

/// HTML単位（行数は追跡しない）
struct HtmlSummary : IndividualSummary {
    explicit HtmlSummary(std::string name_) : IndividualSummary(std::move(name_)) {}

    void accept(SummaryVisitor& visitor) const override;
};

/// パッケージ1つ分のサマリー
struct PackageSummary {
    std::string name;
    std::map<std::string, LibrarySummary> libraries;

    explicit PackageSummary(std::string name_) : name(std::move(name_)) {}

    /// ライブラリを取得（なければ作成）
    LibrarySummary& library(const std::string& id);

    void accept(SummaryVisitor& visitor) const;
};

/// サマリー全体
struct GlobalSummary {
    std::map<std::string, LibrarySummary> system;
    std::map<std::string, PackageSummary> packages;
    std::map<std::string, std::unique_ptr<IndividualSummary>> loose;

    /// パッケージを取得（なければ作成）
    PackageSummary& package(const std::string& name);

    /// system のライブラリを取得（なければ作成）
    LibrarySummary& system_library(const std::string& id);

    /// loose の単位を取得（なければ T で作成）
    /// 既に別の種類で登録されていればそれを返す
    template <typename T>
    IndividualSummary& loose_unit(const std::string& id) {
        auto it = loose.find(id);
        if (it == loose.end()) {
            it = loose.emplace(id, std::make_unique<T>(id)).first;
        }
        return *it->second;
    }

    bool empty() const { return system.empty() && packages.empty() && loose.empty(); }

    void accept(SummaryVisitor& visitor) const;
};

// ============================================================
// ビジター
// ============================================================

/// ノード種別ごとの訪問インターフェース
class SummaryVisitor {
   public:
    virtual ~SummaryVisitor() = default;

    virtual void visit_global(const GlobalSummary& global) = 0;
    virtual void visit_package(const PackageSummary& package) = 0;
    virtual void visit_library(const LibrarySummary& library) = 0;
    virtual void visit_html(const HtmlSummary& html) = 0;
    virtual void visit_message(const MessageSummary& message) = 0;
};

/// 子を深さ優先で辿るデフォルト実装
/// 順序: system → packages → loose、親 → 子
class RecursiveSummaryVisitor : public SummaryVisitor {
   public:
    void visit_global(const GlobalSummary& global) override;
    void visit_package(const PackageSummary& package) override;
    void visit_library(const LibrarySummary& library) override;
    void visit_html(const HtmlSummary& html) override;
    void visit_message(const MessageSummary&) override {}
};

}  // namespace report
}  // namespace tally
