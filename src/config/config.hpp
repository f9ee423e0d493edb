// ============================================================
// レポート設定システム
// ============================================================
// .tallyconfig.yml から集計の設定を読み込む

#pragma once

#include "report/reporter.hpp"

#include <optional>
#include <string>

namespace tally {
namespace config {

/// 設定ファイル名
inline constexpr const char* kConfigFileName = ".tallyconfig.yml";

// 設定ローダー
class ConfigLoader {
   public:
    // 設定ファイルを読み込み
    bool load(const std::string& filepath);

    // 文字列から読み込み（テスト・埋め込み用）
    bool load_from_string(const std::string& content);

    // .tallyconfig.yml を探す（カレントディレクトリから親に向かって）
    bool find_and_load(const std::string& start_path = ".");

    // 設定が読み込まれているか
    bool is_loaded() const { return loaded_; }

    // 設定ファイルのパスを取得
    const std::string& config_path() const { return config_path_; }

    // 読み込んだ設定
    const report::ReportOptions& options() const { return options_; }
    report::ReportOptions& options() { return options_; }

    // 種別が無効化されているか
    bool is_disabled(const std::string& kind) const {
        return options_.disabled_kinds.count(kind) > 0;
    }

   private:
    // 簡易YAMLパーサー（key: value形式のみ）
    bool parse_yaml(const std::string& content);

    // report: 直下のキーを適用
    void apply_setting(const std::string& key, const std::string& value);

    // 種別の有効/無効を適用
    void apply_kind(const std::string& kind, const std::string& state);

    // 欠落単位ポリシーを解析
    static std::optional<report::MissingUnitPolicy> parse_missing_unit(const std::string& text);

    // 行をトリム
    static std::string trim(const std::string& str);

    report::ReportOptions options_;
    std::string config_path_;
    bool loaded_ = false;
};

}  // namespace config
}  // namespace tally
