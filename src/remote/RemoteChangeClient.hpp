#pragma once

#include <string>
#include <vector>

#include "core/Change.hpp"
#include "core/LocalRepository.hpp"
#include "util/Expected.hpp"

namespace gitcl {

/// Server-side change query; empty fields are not filtered on
struct ChangeQuery {
    std::string status{"open"};   // open, merged, abandoned, closed, reviewed, submitted
    std::string owner{"self"};
    bool watched{false};          // is:watched instead of owner
    std::string branch;
    std::string project;
    int limit{0};                 // 0: server default
};

/// A commit to upload as a new patch set of `changeId`
struct PushRequest {
    std::string changeId;
    std::string commit;
    std::string parent;
    std::string branch;                 // Target branch; empty uses the client's default
    std::vector<PackObject> objects;    // Objects the server may not have yet
};

/**
 * @brief Typed operations against the review service
 *
 * Failures use NotFound, NetworkError, AuthFailure, Conflict, NotReady and
 * ProtocolError. No call is retried here.
 */
class RemoteChangeClient {
public:
    virtual ~RemoteChangeClient() = default;

    /// Change with all of its patch sets (sorted, strictly increasing)
    virtual Expected<Change> getChange(const std::string& changeId) = 0;

    virtual Expected<std::vector<PatchSet>> getPatchSets(const std::string& changeId) = 0;

    virtual Expected<std::vector<Change>> listChanges(const ChangeQuery& filter) = 0;

    /// Upload a commit; creates the change when the Change-Id is new to the server
    virtual Expected<PatchSet> pushPatchSet(const PushRequest& request) = 0;

    /// Merge the change's current patch set; returns the merged change
    virtual Expected<Change> submit(const std::string& changeId) = 0;

    /// Formatted patch of one revision (commit id or patch-set number)
    virtual Expected<std::string> getPatch(const std::string& changeId, const std::string& revision) = 0;
};

}
