#pragma once

#include <string>
#include <vector>

#include "core/Change.hpp"
#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"
#include "util/Expected.hpp"

namespace gitcl {

class IPatchDiffer;

/// An object to upload, with its id
struct PackObject {
    std::string hash;
    ObjectType type{ObjectType::Blob};
    std::string payload;
};

/**
 * @brief The developer's local working copy as seen by the reconciliation core
 *
 * Everything returns Expected; implementations never let exceptions escape.
 */
class LocalRepository {
public:
    virtual ~LocalRepository() = default;

    /**
     * @brief Commits in "<base>..<tip>", oldest first
     *
     * First-parent commits reachable from tip and not from base. A range
     * containing a merge commit is InvalidArgs.
     */
    virtual Expected<std::vector<LocalCommit>> listCommits(const std::string& range) = 0;

    virtual Expected<LocalCommit> readCommit(const std::string& hash) = 0;

    /// Write a commit of `tree` on top of `parent` with the configured identity
    virtual Expected<LocalCommit> createCommit(const std::string& tree, const std::string& parent,
                                               const std::string& message) = 0;

    /**
     * @brief Re-apply `commit` (relative to its own parent) on top of `ontoParent`
     *
     * Works in the object store only. The new commit keeps the original
     * author and message. Conflict carries every conflicting path.
     */
    virtual Expected<LocalCommit> cherryPick(const std::string& commit, const std::string& ontoParent) = 0;

    /**
     * @brief Make `ref` the working tree and HEAD
     *
     * A local branch name attaches HEAD; anything else detaches it.
     * Assumes a clean working tree.
     */
    virtual Expected<void> checkout(const std::string& ref) = 0;

    virtual Expected<std::string> resolve(const std::string& ref) = 0;
    virtual Expected<HeadState> head() = 0;
    virtual Expected<void> updateBranch(const std::string& branch, const std::string& commit) = 0;

    /// Index and tracked files match HEAD (untracked files are ignored)
    virtual Expected<bool> isWorktreeClean() = 0;

    /// `commit` plus the trees and blobs its parent's tree does not already contain
    virtual Expected<std::vector<PackObject>> collectPushObjects(const std::string& commit,
                                                                 const std::string& parent) = 0;

    virtual IPatchDiffer& patchDiffer() = 0;
};

}
