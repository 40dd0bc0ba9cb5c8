#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "remote/RemoteChangeClient.hpp"

namespace gitcl::test {

/**
 * @brief In-memory review server
 *
 * Pushes append patch sets (creating the change on first upload), submit
 * marks changes merged. Failures are scripted through the public sets.
 */
class FakeRemote : public RemoteChangeClient {
public:
    /// Register a change whose patch sets are (commit, parent) pairs numbered from 1
    Change& addChange(const std::string& changeId, const std::vector<std::pair<std::string, std::string>>& patchSets,
                      const std::string& subject = "subject", const std::string& branch = "master");

    /// Stored change, nullptr when unknown
    const Change* change(const std::string& changeId) const;

    Expected<Change> getChange(const std::string& changeId) override;
    Expected<std::vector<PatchSet>> getPatchSets(const std::string& changeId) override;
    Expected<std::vector<Change>> listChanges(const ChangeQuery& filter) override;
    Expected<PatchSet> pushPatchSet(const PushRequest& request) override;
    Expected<Change> submit(const std::string& changeId) override;
    Expected<std::string> getPatch(const std::string& changeId, const std::string& revision) override;

    // Scripted behaviour
    std::optional<Error> failAll;            // Every call fails with this error
    std::set<std::string> failPushFor;       // Change-Ids whose upload fails with NetworkError
    std::set<std::string> notReady;          // Change-Ids whose submit is NotReady
    std::set<std::string> conflicting;       // Change-Ids whose submit is a Conflict
    std::map<std::string, std::string> patches;  // Change-Id -> patch text

    // Recorded calls
    std::vector<PushRequest> pushes;
    std::vector<std::string> submitted;
    std::vector<ChangeQuery> queries;
    int getChangeCalls{0};

private:
    std::vector<Change> changes;
    int nextNumber{1000};

    Change* lookup(const std::string& id);
};

}
