#pragma once

#include <string>

#include "core/ChangeIndex.hpp"
#include "util/Expected.hpp"

namespace gitcl {

class IPatchDiffer;
class LocalRepository;
class RemoteChangeClient;

/**
 * @brief Compares local commits with remote change state
 *
 * One reconcile() call is one pass: list the local commits of a range,
 * fetch the remote change for every Change-Id, build the ChangeIndex and
 * classify every binding. Nothing is cached between passes.
 */
class Reconciler {
public:
    Reconciler(LocalRepository& local, RemoteChangeClient& remote, IPatchDiffer& differ)
        : local(local), remote(remote), differ(differ) {}

    /// @param range "<base>..<tip>" as accepted by LocalRepository::listCommits
    Expected<ChangeIndex> reconcile(const std::string& range);

    /// Classify every binding of an already built index
    Expected<void> classifyAll(ChangeIndex& index);

    /**
     * @brief Classify one binding
     *
     *  - no remote change: New
     *  - local commit is the latest patch set: UpToDate
     *  - local commit is an older patch set: RemoteAhead
     *  - latest patch set's commit not available locally: RemoteAhead
     *  - same patch on a different parent: NeedsRebase
     *  - anything else: Diverged
     */
    Expected<Classification> classify(const ChangeBinding& binding);

private:
    LocalRepository& local;
    RemoteChangeClient& remote;
    IPatchDiffer& differ;
};

}
