#include "core/ChangeIndex.hpp"

#include <set>

namespace gitcl {

const char* classificationName(Classification c) {
    switch (c) {
        case Classification::New: return "new";
        case Classification::UpToDate: return "up-to-date";
        case Classification::NeedsRebase: return "needs-rebase";
        case Classification::Diverged: return "diverged";
        case Classification::RemoteAhead: return "remote-ahead";
    }
    return "unknown";
}

Expected<ChangeIndex> ChangeIndex::build(const std::vector<LocalCommit>& localCommits,
                                         const std::vector<Change>& remoteChanges) {
    ChangeIndex index;

    for (const auto& commit : localCommits) {
        if (!commit.changeId) {
            index.unuploaded.push_back(commit);
            continue;
        }
        auto [it, inserted] = index.byChangeId.emplace(*commit.changeId, index.arena.size());
        if (!inserted) {
            const LocalCommit& first = index.arena[it->second].commit;
            Error err{ErrorCode::AmbiguousChangeId,
                      "Change-Id " + *commit.changeId + " is used by more than one local commit"};
            err.paths = {first.hash, commit.hash};
            return err;
        }
        ChangeBinding binding;
        binding.commit = commit;
        index.byCommit[commit.hash] = index.arena.size();
        index.arena.push_back(std::move(binding));
    }

    std::set<std::string> matched;
    for (const auto& change : remoteChanges) {
        for (size_t i = 1; i < change.patchSets.size(); ++i) {
            if (change.patchSets[i].number <= change.patchSets[i - 1].number) {
                return Error{ErrorCode::ProtocolError,
                             "patch sets of " + change.changeId + " are not strictly increasing"};
            }
        }
        auto it = index.byChangeId.find(change.changeId);
        if (it == index.byChangeId.end()) {
            index.untrackedChanges.push_back(change);
            continue;
        }
        if (!matched.insert(change.changeId).second) {
            auto serverId = [](const Change& c) {
                return c.uuid.empty() ? c.project + "~" + c.branch + "~" + c.changeId : c.uuid;
            };
            Error err{ErrorCode::AmbiguousChangeId,
                      "Change-Id " + change.changeId + " names more than one remote change"};
            err.paths = {serverId(*index.arena[it->second].change), serverId(change)};
            return err;
        }
        index.arena[it->second].change = change;
    }

    index.parentOf.assign(index.arena.size(), std::nullopt);
    index.childrenOf.assign(index.arena.size(), {});
    for (size_t i = 0; i < index.arena.size(); ++i) {
        auto parent = index.byCommit.find(index.arena[i].commit.parent());
        if (parent != index.byCommit.end() && parent->second != i) {
            index.parentOf[i] = parent->second;
            index.childrenOf[parent->second].push_back(i);
        }
    }
    return index;
}

std::optional<size_t> ChangeIndex::find(const std::string& changeId) const {
    auto it = byChangeId.find(changeId);
    if (it == byChangeId.end()) return std::nullopt;
    return it->second;
}

std::optional<size_t> ChangeIndex::findByCommit(const std::string& hash) const {
    auto it = byCommit.find(hash);
    if (it == byCommit.end()) return std::nullopt;
    return it->second;
}

DependencyChain ChangeIndex::chainFrom(size_t start) const {
    DependencyChain chain;
    std::vector<size_t> stack{start};
    std::set<size_t> seen;
    while (!stack.empty()) {
        size_t cur = stack.back();
        stack.pop_back();
        if (!seen.insert(cur).second) continue;
        chain.members.push_back(cur);
        const auto& kids = childrenOf[cur];
        // Reverse so the first child is processed first
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
            stack.push_back(*it);
        }
    }
    return chain;
}

std::vector<DependencyChain> ChangeIndex::chains() const {
    std::vector<DependencyChain> out;
    for (size_t i = 0; i < arena.size(); ++i) {
        if (!parentOf[i]) {
            out.push_back(chainFrom(i));
        }
    }
    return out;
}

}
