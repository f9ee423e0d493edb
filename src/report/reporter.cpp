// ============================================================
// SummaryReporter 実装
// ============================================================

#include "reporter.hpp"

#include "common/debug_messages.hpp"
#include "errors.hpp"

#include <fmt/format.h>

namespace tally {
namespace report {

SourceLocation CompilerReporter::create_location(const Message& message,
                                                 const std::string& fallback_file) const {
    Span span = Span::between(message.begin, message.end);
    if (source_) {
        return source_->locate(span);
    }
    // ソースがない場合はオフセットのみ
    SourceLocation loc;
    loc.file = fallback_file;
    loc.span = span;
    return loc;
}

SummaryReporter::SummaryReporter(ReportOptions options) : options_(std::move(options)) {}

UnitHandle SummaryReporter::open_library(const std::string& uri) {
    Resolution resolution = resolve_scope(uri, options_.scope_rules);
    debug::rep::log(debug::rep::Id::Scope,
                    fmt::format("{} -> {}", uri, scope_to_string(resolution.scope)),
                    debug::Level::Trace);

    switch (resolution.scope) {
        case Scope::Package:
            return UnitHandle(&result_.package(resolution.package).library(uri));
        case Scope::System:
            return UnitHandle(&result_.system_library(uri));
        case Scope::Loose:
            break;
    }
    return UnitHandle(&result_.loose_unit<LibrarySummary>(uri));
}

UnitHandle SummaryReporter::open_html(const std::string& uri) {
    return UnitHandle(&result_.loose_unit<HtmlSummary>(uri));
}

bool SummaryReporter::accepts(const Message& message) const {
    if (!is_at_least(message.level, options_.min_level)) {
        debug::rep::log(debug::rep::Id::BelowThreshold, message.kind, debug::Level::Trace);
        return false;
    }
    if (options_.disabled_kinds.count(message.kind) > 0) {
        debug::rep::log(debug::rep::Id::KindDisabled, message.kind, debug::Level::Trace);
        return false;
    }
    return true;
}

void SummaryReporter::record(UnitHandle unit, const Message& message, const Source* source) {
    if (!accepts(message)) {
        return;
    }

    if (!unit) {
        if (options_.missing_unit == MissingUnitPolicy::Drop) {
            debug::rep::log(debug::rep::Id::OrphanDropped, message.kind, debug::Level::Warn);
            return;
        }
        debug::rep::log(debug::rep::Id::OrphanRejected, message.kind, debug::Level::Error);
        throw NoCurrentUnitError(
            fmt::format("message '[{}] {}' reported outside of any library or HTML unit",
                        message.kind, message.text));
    }

    SourceLocation location;
    if (source) {
        location = source->locate(Span::between(message.begin, message.end));
    } else {
        location.file = unit.get()->name;
        location.span = Span::between(message.begin, message.end);
    }

    unit.get()->messages.emplace_back(message.kind, severity_to_string(message.level),
                                      std::move(location), message.text);
    debug::rep::log(debug::rep::Id::Message, message.kind);
}

void SummaryReporter::add_lines(UnitHandle unit, uint64_t lines) {
    if (auto* lib = unit.library()) {
        lib->lines += lines;
        debug::rep::log(debug::rep::Id::LineCount, fmt::format("{} +{}", lib->name, lines),
                        debug::Level::Trace);
    }
}

// ============================================================
// 現在の単位を使うAPI
// ============================================================

void SummaryReporter::enter_library(const std::string& uri) {
    debug::rep::log(debug::rep::Id::EnterLibrary, uri);
    current_ = open_library(uri);
}

void SummaryReporter::leave_library() {
    debug::rep::log(debug::rep::Id::LeaveLibrary);
    current_ = UnitHandle();
}

void SummaryReporter::enter_html(const std::string& uri) {
    debug::rep::log(debug::rep::Id::EnterHtml, uri);
    current_ = open_html(uri);
}

void SummaryReporter::leave_html() {
    debug::rep::log(debug::rep::Id::LeaveHtml);
    current_ = UnitHandle();
}

void SummaryReporter::enter_compilation_unit(const Source& source) {
    CompilerReporter::enter_compilation_unit(source);
    debug::rep::log(debug::rep::Id::EnterUnit, std::string(source.filename()));
    add_lines(current_, source.line_count());
}

void SummaryReporter::leave_compilation_unit() {
    debug::rep::log(debug::rep::Id::LeaveUnit);
    CompilerReporter::leave_compilation_unit();
}

void SummaryReporter::record_line_count(uint64_t lines) {
    add_lines(current_, lines);
}

void SummaryReporter::log(const Message& message) {
    record(current_, message, source_);
}

void SummaryReporter::clear_library(const std::string& uri) {
    debug::rep::log(debug::rep::Id::ClearLibrary, uri);
    UnitHandle unit = open_library(uri);
    unit.get()->messages.clear();
    if (auto* lib = unit.library()) {
        lib->lines = 0;
    }
}

void SummaryReporter::clear_html(const std::string& uri) {
    auto it = result_.loose.find(uri);
    if (it == result_.loose.end()) {
        return;
    }
    debug::rep::log(debug::rep::Id::ClearHtml, uri);
    it->second->messages.clear();
}

void SummaryReporter::clear_all() {
    debug::rep::log(debug::rep::Id::ClearAll);
    result_ = GlobalSummary();
    current_ = UnitHandle();
}

}  // namespace report
}  // namespace tally
