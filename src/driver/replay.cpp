#include "replay.hpp"

#include "common/debug_messages.hpp"

#include <fmt/format.h>

#include <charconv>
#include <fstream>

namespace tally {
namespace driver {

namespace {

// 符号なし整数を解析
template <typename T>
bool parse_number(const std::string& text, T& out) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

// 引数を1つ取り出す（なければエラー）
std::string next_arg(size_t line_no, const std::string& directive, std::istringstream& args,
                     const char* what) {
    std::string value;
    if (!(args >> value)) {
        throw ReplayError(line_no, fmt::format("'{}' requires {}", directive, what));
    }
    return value;
}

std::string trim_left(const std::string& str) {
    size_t start = str.find_first_not_of(" \t");
    return start == std::string::npos ? "" : str.substr(start);
}

}  // namespace

ReplayError::ReplayError(size_t line, const std::string& message)
    : std::runtime_error(fmt::format("[REPLAY] line {}: {}", line, message)), line_(line) {}

TraceReplayer::TraceReplayer(report::CompilerReporter& reporter, std::filesystem::path base_dir)
    : reporter_(reporter), base_dir_(std::move(base_dir)) {}

ReplayStats TraceReplayer::replay_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ReplayError(0, "cannot open trace file: " + path);
    }
    base_dir_ = std::filesystem::path(path).parent_path();
    return replay(file);
}

ReplayStats TraceReplayer::replay(std::istream& in) {
    debug::rpl::log(debug::rpl::Id::Start);
    stats_ = ReplayStats{};

    std::string line;
    size_t line_no = 0;
    try {
        while (std::getline(in, line)) {
            line_no++;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            std::string trimmed = trim_left(line);
            if (trimmed.empty() || trimmed[0] == '#') {
                debug::rpl::log(debug::rpl::Id::Skip, std::to_string(line_no),
                                debug::Level::Trace);
                continue;
            }

            std::istringstream args(trimmed);
            std::string directive;
            args >> directive;
            debug::rpl::dump_event(line_no, directive);
            dispatch(line_no, directive, args);
            stats_.events++;
        }
    } catch (...) {
        // レポーターに解放済みのソースを残さない
        leave_unit();
        throw;
    }
    leave_unit();

    debug::rpl::log(debug::rpl::Id::End, fmt::format("{} events", stats_.events));
    return stats_;
}

void TraceReplayer::dispatch(size_t line_no, const std::string& directive,
                             std::istringstream& args) {
    if (directive == "enter-library") {
        reporter_.enter_library(next_arg(line_no, directive, args, "a unit identifier"));
        stats_.units++;
    } else if (directive == "leave-library") {
        reporter_.leave_library();
    } else if (directive == "enter-html") {
        reporter_.enter_html(next_arg(line_no, directive, args, "a unit identifier"));
        stats_.units++;
    } else if (directive == "leave-html") {
        reporter_.leave_html();
    } else if (directive == "enter-unit") {
        enter_unit(line_no, next_arg(line_no, directive, args, "a source path"));
    } else if (directive == "leave-unit") {
        leave_unit();
    } else if (directive == "lines") {
        uint64_t lines = 0;
        std::string text = next_arg(line_no, directive, args, "a line count");
        if (!parse_number(text, lines)) {
            throw ReplayError(line_no, "invalid line count '" + text + "'");
        }
        reporter_.record_line_count(lines);
    } else if (directive == "log") {
        report::Message message;
        message.kind = next_arg(line_no, directive, args, "a kind");

        std::string level = next_arg(line_no, directive, args, "a severity");
        auto severity = report::parse_severity(level);
        if (!severity || *severity == report::Severity::All) {
            throw ReplayError(line_no, "unknown severity '" + level + "'");
        }
        message.level = *severity;

        std::string begin = next_arg(line_no, directive, args, "a begin offset");
        std::string end = next_arg(line_no, directive, args, "an end offset");
        if (!parse_number(begin, message.begin) || !parse_number(end, message.end)) {
            throw ReplayError(line_no, "invalid offsets '" + begin + " " + end + "'");
        }

        std::string rest;
        std::getline(args, rest);
        message.text = trim_left(rest);

        reporter_.log(message);
        stats_.messages++;
    } else if (directive == "clear-library") {
        reporter_.clear_library(next_arg(line_no, directive, args, "a unit identifier"));
    } else if (directive == "clear-html") {
        reporter_.clear_html(next_arg(line_no, directive, args, "a unit identifier"));
    } else if (directive == "clear-all") {
        reporter_.clear_all();
    } else {
        throw ReplayError(line_no, "unknown directive '" + directive + "'");
    }
}

void TraceReplayer::enter_unit(size_t line_no, const std::string& path) {
    leave_unit();

    std::filesystem::path full = base_dir_.empty() ? std::filesystem::path(path) : base_dir_ / path;
    std::ifstream file(full);
    if (!file.is_open()) {
        throw ReplayError(line_no, "cannot open source file: " + full.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    source_ = std::make_unique<Source>(buffer.str(), path);
    debug::rpl::log(debug::rpl::Id::SourceLoaded,
                    fmt::format("{} ({} lines)", path, source_->line_count()));
    reporter_.enter_compilation_unit(*source_);
}

void TraceReplayer::leave_unit() {
    if (source_) {
        reporter_.leave_compilation_unit();
        source_.reset();
    }
}

}  // namespace driver
}  // namespace tally
