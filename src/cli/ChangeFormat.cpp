#include "cli/ChangeFormat.hpp"

#include <iomanip>

#include "core/Constants.hpp"

namespace gitcl {

namespace ChangeFormat {

std::string shortHash(const std::string& hash) {
    return hash.substr(0, Constants::SHORT_HASH_LENGTH);
}

void printSummary(std::ostream& out, const Change& change) {
    out << "change-id " << change.changeId;
    if (change.number > 0) out << " (" << change.number << ")";
    out << "\n";
    out << "Owner:   " << change.owner.display() << "\n";
    out << "Subject: " << change.subject << "\n";
}

void printDetail(std::ostream& out, const Change& change) {
    printSummary(out, change);
    out << "Project: " << change.project << " (" << change.branch << ")\n";
    out << "Status:  " << changeStatusName(change.status) << "\n";
    if (change.patchSets.empty()) {
        return;
    }
    out << "\nPatch sets:\n";
    for (const auto& ps : change.patchSets) {
        out << "  " << std::setw(3) << ps.number << "  " << shortHash(ps.commitHash)
            << "  parent " << (ps.parentHash.empty() ? std::string("-") : shortHash(ps.parentHash));
        if (!ps.created.empty()) out << "  " << ps.created;
        out << "\n";
    }
}

void printReport(std::ostream& out, const RebaseReport& report) {
    for (const auto& e : report.entries) {
        out << std::left << std::setw(12) << rebaseStateName(e.outcome) << std::right << e.changeId << "  "
            << shortHash(e.originalCommit);
        if (!e.resultCommit.empty() && e.resultCommit != e.originalCommit) {
            out << " -> " << shortHash(e.resultCommit);
        }
        if (e.patchSet > 0) out << "  patch set " << e.patchSet;
        out << "  " << e.subject << "\n";
        for (const auto& path : e.conflictPaths) {
            out << "    conflict: " << path << "\n";
        }
        if (e.error) {
            out << "    " << errorCodeName(e.error->code) << ": " << e.error->message << "\n";
        }
    }
    out << report.pushes << " patch set(s) uploaded, " << report.rewrites << " commit(s) rewritten\n";
}

}

}
