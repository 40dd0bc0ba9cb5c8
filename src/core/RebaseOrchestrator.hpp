#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/ChangeIndex.hpp"
#include "core/RebaseSession.hpp"
#include "util/Expected.hpp"

namespace gitcl {

class LocalRepository;
class RemoteChangeClient;

/// Outcome for one chain member
struct RebaseEntry {
    std::string changeId;
    std::string subject;
    std::string originalCommit;
    std::string resultCommit;           // Set for SKIPPED and REBASED
    int patchSet{0};                    // Number of the pushed patch set, 0 when nothing was pushed
    RebaseState outcome{RebaseState::Unprocessed};
    std::vector<std::string> conflictPaths;
    std::optional<Error> error;         // Why the member FAILED
};

struct RebaseReport {
    std::vector<RebaseEntry> entries;   // Chain order
    std::string newTip;                 // Last SKIPPED/REBASED commit, empty when none
    size_t pushes{0};
    size_t rewrites{0};
    std::optional<Error> localUpdateError;  // Branch/worktree update after the walk failed

    /// Every member SKIPPED or REBASED and the local update went through
    bool succeeded() const;
};

/**
 * @brief Rebases a dependency chain onto a new base, one member at a time
 *
 * Preconditions are checked before anything is written: clean working
 * tree, a Change-Id on every commit from the chain start to HEAD, no member
 * REMOTE_AHEAD or DIVERGED, a resolvable target base, and no local commit
 * left below the chain start (it would fall off the branch).
 *
 * The first conflict or push failure halts the walk; later members are
 * BLOCKED. Patch sets pushed before the halt stay pushed.
 */
class RebaseOrchestrator {
public:
    RebaseOrchestrator(LocalRepository& local, RemoteChangeClient& remote) : local(local), remote(remote) {}

    Expected<RebaseReport> rebase(const ChangeIndex& index, const DependencyChain& chain,
                                  const std::string& targetBase);

private:
    LocalRepository& local;
    RemoteChangeClient& remote;

    Expected<void> checkPreconditions(const ChangeIndex& index, const DependencyChain& chain,
                                      const std::string& baseCommit);
    void updateLocal(RebaseReport& report, bool completed);
};

}
