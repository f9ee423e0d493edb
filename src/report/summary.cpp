#include "summary.hpp"

namespace tally {
namespace report {

void MessageSummary::accept(SummaryVisitor& visitor) const {
    visitor.visit_message(*this);
}

void LibrarySummary::accept(SummaryVisitor& visitor) const {
    visitor.visit_library(*this);
}

void HtmlSummary::accept(SummaryVisitor& visitor) const {
    visitor.visit_html(*this);
}

LibrarySummary& PackageSummary::library(const std::string& id) {
    return libraries.try_emplace(id, id).first->second;
}

void PackageSummary::accept(SummaryVisitor& visitor) const {
    visitor.visit_package(*this);
}

PackageSummary& GlobalSummary::package(const std::string& name) {
    return packages.try_emplace(name, name).first->second;
}

LibrarySummary& GlobalSummary::system_library(const std::string& id) {
    return system.try_emplace(id, id).first->second;
}

void GlobalSummary::accept(SummaryVisitor& visitor) const {
    visitor.visit_global(*this);
}

// ============================================================
// RecursiveSummaryVisitor
// ============================================================

void RecursiveSummaryVisitor::visit_global(const GlobalSummary& global) {
    for (const auto& [id, lib] : global.system) {
        lib.accept(*this);
    }
    for (const auto& [name, package] : global.packages) {
        package.accept(*this);
    }
    for (const auto& [id, unit] : global.loose) {
        unit->accept(*this);
    }
}

void RecursiveSummaryVisitor::visit_package(const PackageSummary& package) {
    for (const auto& [id, lib] : package.libraries) {
        lib.accept(*this);
    }
}

void RecursiveSummaryVisitor::visit_library(const LibrarySummary& library) {
    for (const auto& message : library.messages) {
        message.accept(*this);
    }
}

void RecursiveSummaryVisitor::visit_html(const HtmlSummary& html) {
    for (const auto& message : html.messages) {
        message.accept(*this);
    }
}

}  // namespace report
}  // namespace tally
