#include "unit_id.hpp"

#include <algorithm>
#include <cctype>

namespace tally {
namespace report {

// RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
bool is_valid_scheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

std::optional<std::string> normalize_scheme(const std::string& scheme) {
    if (!is_valid_scheme(scheme)) {
        return std::nullopt;
    }
    // scheme は大文字小文字を区別しない
    std::string lowered = scheme;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

UnitId UnitId::parse(const std::string& text) {
    UnitId id;
    id.text = text;

    size_t colon = text.find(':');
    if (colon == std::string::npos) {
        id.path = text;
        return id;
    }

    auto scheme = normalize_scheme(text.substr(0, colon));
    if (!scheme) {
        id.path = text;
        return id;
    }

    id.scheme = std::move(*scheme);
    id.path = text.substr(colon + 1);
    return id;
}

Resolution resolve_scope(const UnitId& id, const ScopeRules& rules) {
    Resolution result;
    if (!id.has_scheme() || id.path.empty()) {
        return result;
    }

    if (id.scheme == rules.package_scheme) {
        // パッケージ名はパスの先頭セグメント
        std::string name = id.path.substr(0, id.path.find('/'));
        if (!name.empty()) {
            result.scope = Scope::Package;
            result.package = std::move(name);
        }
        return result;
    }

    if (rules.system_schemes.count(id.scheme) > 0) {
        result.scope = Scope::System;
    }
    return result;
}

}  // namespace report
}  // namespace tally
