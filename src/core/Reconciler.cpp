#include "core/Reconciler.hpp"

#include "core/LocalRepository.hpp"
#include "core/PatchDiffer.hpp"
#include "remote/RemoteChangeClient.hpp"
#include "util/Logger.hpp"

namespace gitcl {

Expected<ChangeIndex> Reconciler::reconcile(const std::string& range) {
    auto commits = local.listCommits(range);
    if (!commits) return commits.error();

    std::vector<Change> remoteChanges;
    for (const auto& commit : commits.value()) {
        if (!commit.changeId) continue;
        auto change = remote.getChange(*commit.changeId);
        if (change) {
            remoteChanges.push_back(change.value());
        } else if (change.error().code == ErrorCode::NotFound) {
            Logger::instance().debug(*commit.changeId + " is not on the server yet");
        } else {
            return change.error();
        }
    }

    auto index = ChangeIndex::build(commits.value(), remoteChanges);
    if (!index) return index.error();

    auto classified = classifyAll(index.value());
    if (!classified) return classified.error();
    return index;
}

Expected<void> Reconciler::classifyAll(ChangeIndex& index) {
    for (size_t i = 0; i < index.size(); ++i) {
        auto c = classify(index.binding(i));
        if (!c) return c.error();
        index.binding(i).classification = c.value();
        Logger::instance().debug(index.binding(i).changeId() + " " + index.binding(i).commit.hash.substr(0, 7) +
                                 ": " + classificationName(c.value()));
    }
    return {};
}

Expected<Classification> Reconciler::classify(const ChangeBinding& binding) {
    if (!binding.change) {
        return Classification::New;
    }
    const Change& change = *binding.change;
    const PatchSet* latest = change.latest();
    if (!latest) {
        return Classification::New;
    }
    const LocalCommit& commit = binding.commit;

    if (commit.hash == latest->commitHash) {
        return Classification::UpToDate;
    }
    if (change.findByCommit(commit.hash)) {
        return Classification::RemoteAhead;
    }

    auto remotePatch = differ.diff(latest->commitHash, latest->parentHash);
    if (!remotePatch) {
        if (remotePatch.error().code == ErrorCode::ObjectNotFound) {
            // Newer upload from elsewhere that was never fetched
            return Classification::RemoteAhead;
        }
        return remotePatch.error();
    }
    auto localPatch = differ.diff(commit.hash, commit.parent());
    if (!localPatch) return localPatch.error();

    if (localPatch.value().id() != remotePatch.value().id()) {
        return Classification::Diverged;
    }
    if (commit.parent() != latest->parentHash) {
        return Classification::NeedsRebase;
    }
    // Same content on the same parent, different commit: message or author was amended
    return Classification::Diverged;
}

}
