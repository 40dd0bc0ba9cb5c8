#include "core/Change.hpp"

namespace gitcl {

const char* changeStatusName(ChangeStatus status) {
    switch (status) {
        case ChangeStatus::New: return "NEW";
        case ChangeStatus::Merged: return "MERGED";
        case ChangeStatus::Abandoned: return "ABANDONED";
    }
    return "UNKNOWN";
}

std::string Account::display() const {
    if (!name.empty() && !email.empty()) return name + " <" + email + ">";
    if (!name.empty()) return name;
    if (!email.empty()) return "<" + email + ">";
    return username;
}

const PatchSet* Change::findByCommit(const std::string& commitHash) const {
    for (const auto& ps : patchSets) {
        if (ps.commitHash == commitHash) return &ps;
    }
    return nullptr;
}

}
