#include "options.hpp"

#include "common/debug_messages.hpp"
#include "config/config.hpp"

namespace tally {
namespace driver {

bool build_report_options(const Options& opts, report::ReportOptions& out, std::string& error) {
    config::ConfigLoader loader;
    if (!opts.config_file.empty()) {
        if (!loader.load(opts.config_file)) {
            error = "設定ファイルを読み込めません: " + opts.config_file;
            return false;
        }
    } else {
        // 見つからなければ既定値のまま
        loader.find_and_load(opts.config_search_dir);
    }
    out = loader.options();

    // コマンドラインの指定が設定ファイルより優先
    if (!opts.level.empty()) {
        auto level = report::parse_severity(opts.level);
        if (!level) {
            error = "不明な重大度 '" + opts.level + "'";
            return false;
        }
        debug::cfg::log(debug::cfg::Id::Override, "level=" + opts.level);
        out.min_level = *level;
    }
    if (opts.drop_orphans) {
        debug::cfg::log(debug::cfg::Id::Override, "missing_unit=drop");
        out.missing_unit = report::MissingUnitPolicy::Drop;
    }
    return true;
}

}  // namespace driver
}  // namespace tally
