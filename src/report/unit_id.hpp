#pragma once

// ============================================================
// 単位識別子の解決 - scheme:path からスコープを判定
// ============================================================

#include <optional>
#include <set>
#include <string>

namespace tally {
namespace report {

/// 単位の所属
enum class Scope {
    System,   // プラットフォーム提供
    Package,  // 名前付きパッケージに所属
    Loose     // それ以外
};

inline const char* scope_to_string(Scope scope) {
    switch (scope) {
        case Scope::System:
            return "system";
        case Scope::Package:
            return "package";
        case Scope::Loose:
            return "loose";
    }
    return "unknown";
}

/// RFC 3986 の scheme 文法に合うか
bool is_valid_scheme(const std::string& scheme);

/// scheme を比較用に小文字化（不正なら nullopt）
std::optional<std::string> normalize_scheme(const std::string& scheme);

/// スコープ判定ルール（scheme は小文字で保持する）
struct ScopeRules {
    std::set<std::string> system_schemes = {"dart", "platform"};
    std::string package_scheme = "package";
};

/// 識別子を scheme と path に分解したもの
struct UnitId {
    std::string text;    // 元の文字列（サマリーのキー）
    std::string scheme;  // 不正な場合は空
    std::string path;

    /// "scheme:path" を分解（不正な scheme は空として扱う）
    static UnitId parse(const std::string& text);

    bool has_scheme() const { return !scheme.empty(); }
};

/// 判定結果
struct Resolution {
    Scope scope = Scope::Loose;
    std::string package;  // Scope::Package のときのみ
};

/// 識別子のスコープを判定（例外は投げない）
Resolution resolve_scope(const UnitId& id, const ScopeRules& rules = ScopeRules{});

inline Resolution resolve_scope(const std::string& text, const ScopeRules& rules = ScopeRules{}) {
    return resolve_scope(UnitId::parse(text), rules);
}

}  // namespace report
}  // namespace tally
