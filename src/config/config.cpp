// ============================================================
// レポート設定システム - 実装
// ============================================================

#include "config.hpp"

#include "common/debug_messages.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace tally {
namespace config {

bool ConfigLoader::load(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (parse_yaml(buffer.str())) {
        config_path_ = filepath;
        loaded_ = true;
        debug::cfg::log(debug::cfg::Id::Loaded, filepath, debug::Level::Info);
        return true;
    }
    return false;
}

bool ConfigLoader::load_from_string(const std::string& content) {
    if (parse_yaml(content)) {
        loaded_ = true;
        return true;
    }
    return false;
}

bool ConfigLoader::find_and_load(const std::string& start_path) {
    std::error_code ec;
    fs::path current = fs::absolute(start_path, ec);
    if (ec) {
        return false;
    }
    debug::cfg::log(debug::cfg::Id::Search, current.string());

    // 最大10レベルまで親ディレクトリを探索
    for (int i = 0; i < 10; ++i) {
        fs::path config_file = current / kConfigFileName;
        if (fs::exists(config_file, ec)) {
            debug::cfg::log(debug::cfg::Id::Found, config_file.string());
            return load(config_file.string());
        }

        // 親ディレクトリへ
        fs::path parent = current.parent_path();
        if (parent == current) {
            break;  // ルートに到達
        }
        current = parent;
    }

    debug::cfg::log(debug::cfg::Id::NotFound);
    return false;
}

bool ConfigLoader::parse_yaml(const std::string& content) {
    // 簡易YAMLパーサー
    // サポート形式:
    // report:
    //   level: warning
    //   missing_unit: drop
    //   system_schemes: dart, platform
    //   package_scheme: package
    //   kinds:
    //     TypeError: disabled

    std::istringstream stream(content);
    std::string line;

    bool in_report_section = false;
    bool in_kinds_section = false;

    while (std::getline(stream, line)) {
        // 行末コメントを除去
        size_t hash = line.find(" #");
        if (hash != std::string::npos) {
            line = line.substr(0, hash);
        }

        // コメント行をスキップ
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        // インデントレベルを計算
        size_t indent = 0;
        for (char c : line) {
            if (c == ' ')
                indent++;
            else if (c == '\t')
                indent += 2;  // タブは2スペースとして扱う
            else
                break;
        }

        size_t colon_pos = trimmed.find(':');
        std::string key = trim(trimmed.substr(0, colon_pos));
        std::string value =
            colon_pos == std::string::npos ? "" : trim(trimmed.substr(colon_pos + 1));

        // セクション判定
        if (indent == 0) {
            in_report_section = (key == "report");
            in_kinds_section = false;
        } else if (in_report_section && indent >= 2 && indent < 4) {
            in_kinds_section = (key == "kinds");
            if (!in_kinds_section) {
                apply_setting(key, value);
            }
        } else if (in_kinds_section && indent >= 4) {
            if (!key.empty() && !value.empty()) {
                apply_kind(key, value);
            }
        }
    }

    return true;  // 空の設定も有効
}

void ConfigLoader::apply_setting(const std::string& key, const std::string& value) {
    if (key == "level") {
        if (auto level = report::parse_severity(value)) {
            options_.min_level = *level;
            return;
        }
    } else if (key == "missing_unit") {
        if (auto policy = parse_missing_unit(value)) {
            options_.missing_unit = *policy;
            return;
        }
    } else if (key == "system_schemes") {
        // カンマ区切り。識別子側と同じく小文字で保持する
        std::set<std::string> schemes;
        std::istringstream scheme_stream(value);
        std::string scheme;
        while (std::getline(scheme_stream, scheme, ',')) {
            std::string trimmed_scheme = trim(scheme);
            if (trimmed_scheme.empty()) {
                continue;
            }
            if (auto normalized = report::normalize_scheme(trimmed_scheme)) {
                schemes.insert(std::move(*normalized));
            } else {
                debug::cfg::log(debug::cfg::Id::UnknownKey, key + ": " + trimmed_scheme,
                                debug::Level::Warn);
            }
        }
        if (!schemes.empty()) {
            options_.scope_rules.system_schemes = std::move(schemes);
        }
        return;
    } else if (key == "package_scheme") {
        if (auto normalized = report::normalize_scheme(value)) {
            options_.scope_rules.package_scheme = std::move(*normalized);
            return;
        }
    }
    debug::cfg::log(debug::cfg::Id::UnknownKey, key + ": " + value, debug::Level::Warn);
}

void ConfigLoader::apply_kind(const std::string& kind, const std::string& state) {
    if (state == "disabled" || state == "off") {
        options_.disabled_kinds.insert(kind);
    } else if (state == "enabled" || state == "on") {
        options_.disabled_kinds.erase(kind);
    } else {
        debug::cfg::log(debug::cfg::Id::UnknownKey, kind + ": " + state, debug::Level::Warn);
    }
}

std::optional<report::MissingUnitPolicy> ConfigLoader::parse_missing_unit(const std::string& text) {
    if (text == "error")
        return report::MissingUnitPolicy::Error;
    if (text == "drop")
        return report::MissingUnitPolicy::Drop;
    return std::nullopt;
}

std::string ConfigLoader::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

}  // namespace config
}  // namespace tally
