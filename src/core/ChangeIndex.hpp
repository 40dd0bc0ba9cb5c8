#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/Change.hpp"
#include "util/Expected.hpp"

namespace gitcl {

enum class Classification { New, UpToDate, NeedsRebase, Diverged, RemoteAhead };

/// Lowercase display name ("needs-rebase")
const char* classificationName(Classification c);

/**
 * @brief A local commit paired with the remote change carrying its Change-Id
 *
 * Rebuilt on every reconciliation pass, never persisted.
 */
struct ChangeBinding {
    LocalCommit commit;
    std::optional<Change> change;                      // Absent: not on the server yet
    Classification classification{Classification::New};

    const std::string& changeId() const { return *commit.changeId; }
};

/// Binding indices in dependency order, the base of the stack first
struct DependencyChain {
    std::vector<size_t> members;

    bool empty() const { return members.empty(); }
    size_t size() const { return members.size(); }
};

/**
 * @brief Change-Id -> ChangeBinding map with the dependency graph between bindings
 *
 * Bindings live in one flat vector; dependencies are kept as index
 * adjacency lists so no binding points at another.
 */
class ChangeIndex {
public:
    /**
     * @brief Pair local commits with remote changes by Change-Id
     *
     * Commits without a Change-Id are kept aside as not uploaded. Remote
     * changes no local commit refers to are kept aside as untracked. Two
     * local commits with the same Change-Id fail with AmbiguousChangeId;
     * a remote change whose patch-set numbers do not strictly increase
     * fails with ProtocolError.
     */
    static Expected<ChangeIndex> build(const std::vector<LocalCommit>& localCommits,
                                       const std::vector<Change>& remoteChanges);

    const std::vector<ChangeBinding>& bindings() const { return arena; }
    ChangeBinding& binding(size_t i) { return arena[i]; }
    const ChangeBinding& binding(size_t i) const { return arena[i]; }
    size_t size() const { return arena.size(); }

    const std::vector<LocalCommit>& notUploaded() const { return unuploaded; }
    const std::vector<Change>& untracked() const { return untrackedChanges; }

    std::optional<size_t> find(const std::string& changeId) const;
    std::optional<size_t> findByCommit(const std::string& hash) const;

    /// Binding whose commit is this binding's parent
    std::optional<size_t> dependencyOf(size_t i) const { return parentOf[i]; }
    const std::vector<size_t>& dependentsOf(size_t i) const { return childrenOf[i]; }

    /// `start` and everything transitively depending on it, parents before children
    DependencyChain chainFrom(size_t start) const;

    /// One chain per stack base (binding without a dependency)
    std::vector<DependencyChain> chains() const;

private:
    std::vector<ChangeBinding> arena;
    std::map<std::string, size_t> byChangeId;
    std::map<std::string, size_t> byCommit;
    std::vector<std::optional<size_t>> parentOf;
    std::vector<std::vector<size_t>> childrenOf;
    std::vector<LocalCommit> unuploaded;
    std::vector<Change> untrackedChanges;
};

}
