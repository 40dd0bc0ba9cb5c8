#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gitcl {

enum class ChangeStatus { New, Merged, Abandoned };

const char* changeStatusName(ChangeStatus status);

struct Account {
    std::string name;
    std::string email;
    std::string username;

    /// "Name <email>", falling back to whichever part is known
    std::string display() const;
};

/// One revision of a Change
struct PatchSet {
    int number{0};              // 1-based, strictly increasing within a Change
    std::string commitHash;
    std::string parentHash;     // First parent of the revision's commit
    std::string created;        // Server timestamp, "2024-01-31 12:00:00.000000000"
};

/**
 * @brief A remote review unit
 *
 * Owned by the review service; the client only observes it. `patchSets` is
 * kept sorted by number.
 */
struct Change {
    std::string changeId;       // "I<hex>", stable across rebases
    std::string uuid;           // Server-side "project~branch~Change-Id"
    int number{0};              // Legacy sequential id
    std::string project;
    std::string branch;
    std::string subject;
    ChangeStatus status{ChangeStatus::New};
    Account owner;
    std::vector<PatchSet> patchSets;

    /// Highest-numbered patch set, nullptr when none is known
    const PatchSet* latest() const {
        return patchSets.empty() ? nullptr : &patchSets.back();
    }

    /// Patch set with the given commit, nullptr when none matches
    const PatchSet* findByCommit(const std::string& commitHash) const;
};

/// A commit in the developer's local history
struct LocalCommit {
    std::string hash;
    std::vector<std::string> parents;
    std::optional<std::string> changeId;   // From the message trailer
    std::string author;                     // "Name <email>"
    std::string subject;

    std::string parent() const { return parents.empty() ? std::string() : parents.front(); }
};

}
