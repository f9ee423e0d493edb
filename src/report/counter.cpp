#include "counter.hpp"

#include "common/debug_messages.hpp"

namespace tally {
namespace report {

void OrderedCounts::add(const std::string& key, uint64_t amount) {
    auto [it, inserted] = counts_.try_emplace(key, 0);
    if (inserted) {
        keys_.push_back(key);
    }
    it->second += amount;
}

uint64_t OrderedCounts::get(const std::string& key) const {
    auto it = counts_.find(key);
    return it != counts_.end() ? it->second : 0;
}

// ============================================================
// Counter
// ============================================================

std::string Counter::label(const PackageKey& package) {
    return package ? *package : kOtherPackage;
}

const OrderedCounts& Counter::error_count(const PackageKey& package) const {
    static const OrderedCounts none;
    auto it = error_count_.find(package);
    return it != error_count_.end() ? it->second : none;
}

uint64_t Counter::lines_of_code(const PackageKey& package) const {
    auto it = lines_of_code_.find(package);
    return it != lines_of_code_.end() ? it->second : 0;
}

void Counter::touch(const PackageKey& package) {
    if (lines_of_code_.try_emplace(package, 0).second) {
        packages_.push_back(package);
    }
}

void Counter::visit_global(const GlobalSummary& global) {
    debug::cnt::log(debug::cnt::Id::Start);
    RecursiveSummaryVisitor::visit_global(global);
    debug::cnt::log(debug::cnt::Id::End, std::to_string(total_lines_of_code_) + " lines");
}

void Counter::visit_package(const PackageSummary& package) {
    debug::cnt::log(debug::cnt::Id::Package, package.name);
    current_package_ = package.name;
    touch(current_package_);
    RecursiveSummaryVisitor::visit_package(package);
    current_package_.reset();
}

void Counter::visit_library(const LibrarySummary& library) {
    debug::cnt::log(debug::cnt::Id::Library, library.name, debug::Level::Trace);
    touch(current_package_);
    RecursiveSummaryVisitor::visit_library(library);
    lines_of_code_[current_package_] += library.lines;
    total_lines_of_code_ += library.lines;
}

void Counter::visit_html(const HtmlSummary& html) {
    debug::cnt::log(debug::cnt::Id::Html, html.name, debug::Level::Trace);
    // HTMLは行数を持たないが、集計行は用意する
    touch(current_package_);
    RecursiveSummaryVisitor::visit_html(html);
}

void Counter::visit_message(const MessageSummary& message) {
    const std::string& kind = message.kind;
    if (!totals_.contains(kind)) {
        debug::cnt::log(debug::cnt::Id::NewKind, kind);
    }
    error_count_[current_package_].add(kind);
    totals_.add(kind);
}

}  // namespace report
}  // namespace tally
