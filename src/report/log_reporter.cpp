#include "log_reporter.hpp"

#include <fmt/format.h>

namespace tally {
namespace report {

void LogReporter::log(const Message& message) {
    if (!is_at_least(message.level, min_level_)) {
        return;
    }
    sink_.write(message.level, format(message));
}

std::string LogReporter::format(const Message& message) const {
    SourceLocation loc = create_location(message, current_.empty() ? "<unknown>" : current_);
    std::string text = fmt::format("[{}] {}", message.kind, message.text);

    if (!loc.is_resolved()) {
        return fmt::format("{}: {}: {}\n", loc.file, severity_to_string(message.level), text);
    }

    // ファイル:行:列
    std::string out = fmt::format("{}:{}:{}: {}: {}\n", loc.file, loc.begin.line,
                                  loc.begin.column, severity_to_string(message.level), text);

    // ソース行とキャレット
    out += "    " + loc.line_text + "\n";
    out += "    " + std::string(loc.begin.column - 1, ' ') + "^\n";
    return out;
}

}  // namespace report
}  // namespace tally
