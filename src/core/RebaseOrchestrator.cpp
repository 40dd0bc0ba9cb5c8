#include "core/RebaseOrchestrator.hpp"

#include <set>

#include "core/LocalRepository.hpp"
#include "remote/RemoteChangeClient.hpp"
#include "util/Logger.hpp"

namespace gitcl {

namespace {

bool isLocalCommit(const ChangeIndex& index, const std::string& hash) {
    if (hash.empty()) return false;
    if (index.findByCommit(hash)) return true;
    for (const auto& commit : index.notUploaded()) {
        if (commit.hash == hash) return true;
    }
    return false;
}

}

bool RebaseReport::succeeded() const {
    if (localUpdateError) return false;
    for (const auto& e : entries) {
        if (e.outcome != RebaseState::Skipped && e.outcome != RebaseState::Rebased) return false;
    }
    return true;
}

Expected<void> RebaseOrchestrator::checkPreconditions(const ChangeIndex& index, const DependencyChain& chain,
                                                      const std::string& baseCommit) {
    // Moving the branch would drop local commits sitting below the chain start
    const ChangeBinding& first = index.binding(chain.members.front());
    const std::string& below = first.commit.parent();
    if (below != baseCommit && isLocalCommit(index, below)) {
        return Error{ErrorCode::InvalidArgs, first.changeId() + " depends on local commit " + below.substr(0, 9) +
                                                 "; rebase from the bottom of the stack or onto that commit"};
    }

    auto clean = local.isWorktreeClean();
    if (!clean) return clean.error();
    if (!clean.value()) {
        return Error{ErrorCode::DirtyWorktree, "working tree has uncommitted changes; commit or stash them first"};
    }

    // Every commit from the chain start up to HEAD must be a change
    const std::string& startParent = index.binding(chain.members.front()).commit.parent();
    auto stack = local.listCommits(startParent.empty() ? std::string("HEAD") : startParent + "..HEAD");
    if (!stack) return stack.error();

    Error missing{ErrorCode::MissingChangeId, "commits without a Change-Id trailer sit on top of the rebase base"};
    std::set<std::string> onStack;
    for (const auto& commit : stack.value()) {
        onStack.insert(commit.hash);
        if (!commit.changeId) {
            missing.paths.push_back(commit.hash.substr(0, 9) + " " + commit.subject);
        }
    }
    if (!missing.paths.empty()) return missing;

    for (size_t m : chain.members) {
        const ChangeBinding& b = index.binding(m);
        if (!onStack.count(b.commit.hash)) {
            return Error{ErrorCode::InvalidArgs, b.changeId() + " is not between its base and HEAD"};
        }
        if (b.classification == Classification::RemoteAhead) {
            return Error{ErrorCode::RemoteAhead,
                         b.changeId() + " has a newer patch set on the server; update the local commit first"};
        }
        if (b.classification == Classification::Diverged) {
            return Error{ErrorCode::Diverged,
                         b.changeId() + " differs from its latest patch set beyond a rebase; reconcile it first"};
        }
    }
    return {};
}

Expected<RebaseReport> RebaseOrchestrator::rebase(const ChangeIndex& index, const DependencyChain& chain,
                                                  const std::string& targetBase) {
    if (chain.empty()) {
        return Error{ErrorCode::InvalidArgs, "nothing to rebase"};
    }
    auto baseCommit = local.resolve(targetBase);
    if (!baseCommit) {
        Error err = baseCommit.error();
        if (err.code != ErrorCode::RefNotFound && err.code != ErrorCode::ObjectNotFound) return err;
        err.code = ErrorCode::RefNotFound;
        return err;
    }
    auto ready = checkPreconditions(index, chain, baseCommit.value());
    if (!ready) return ready.error();

    Logger::instance().info("rebasing " + std::to_string(chain.size()) + " change(s) onto " + targetBase + " (" +
                            baseCommit.value().substr(0, 9) + ")");

    RebaseSession session(index, chain);
    RebaseReport report;
    std::string base = baseCommit.value();
    bool halted = false;

    for (size_t m : chain.members) {
        const ChangeBinding& b = index.binding(m);
        RebaseEntry entry;
        entry.changeId = b.changeId();
        entry.subject = b.commit.subject;
        entry.originalCommit = b.commit.hash;

        auto move = [&](RebaseState to) -> Expected<void> {
            auto moved = session.transition(m, to);
            if (moved) entry.outcome = to;
            return moved;
        };

        if (halted) {
            auto moved = move(RebaseState::Blocked);
            if (!moved) return moved.error();
            report.entries.push_back(entry);
            continue;
        }

        if (b.classification == Classification::UpToDate && b.commit.parent() == base) {
            auto moved = move(RebaseState::Skipped);
            if (!moved) return moved.error();
            entry.resultCommit = b.commit.hash;
            base = b.commit.hash;
            report.newTip = base;
            report.entries.push_back(entry);
            continue;
        }

        auto moved = move(RebaseState::Rebasing);
        if (!moved) return moved.error();

        std::string newCommit = b.commit.hash;
        if (b.commit.parent() != base) {
            auto picked = local.cherryPick(b.commit.hash, base);
            if (!picked) {
                const Error& err = picked.error();
                auto done = move(err.code == ErrorCode::Conflict ? RebaseState::Conflicted : RebaseState::Failed);
                if (!done) return done.error();
                entry.conflictPaths = err.paths;
                if (err.code != ErrorCode::Conflict) entry.error = err;
                Logger::instance().warn(entry.changeId + ": " + err.message);
                halted = true;
                report.entries.push_back(entry);
                continue;
            }
            newCommit = picked.value().hash;
            ++report.rewrites;
        }

        auto objects = local.collectPushObjects(newCommit, base);
        Expected<PatchSet> pushed = objects
            ? remote.pushPatchSet(PushRequest{entry.changeId, newCommit, base,
                                              b.change ? b.change->branch : std::string(), objects.value()})
            : Expected<PatchSet>(objects.error());
        if (!pushed) {
            auto done = move(RebaseState::Failed);
            if (!done) return done.error();
            entry.error = pushed.error();
            entry.resultCommit = newCommit;
            Logger::instance().warn(entry.changeId + ": upload failed: " + pushed.error().message);
            halted = true;
            report.entries.push_back(entry);
            continue;
        }
        ++report.pushes;

        auto done = move(RebaseState::Rebased);
        if (!done) return done.error();
        entry.resultCommit = newCommit;
        entry.patchSet = pushed.value().number;
        base = newCommit;
        report.newTip = base;
        report.entries.push_back(entry);
    }

    updateLocal(report, !halted);
    return report;
}

void RebaseOrchestrator::updateLocal(RebaseReport& report, bool completed) {
    if (report.newTip.empty()) {
        return;
    }
    // Nothing rewritten up to the tip: the existing history already is the result
    bool rewritten = false;
    for (const auto& e : report.entries) {
        if ((e.outcome == RebaseState::Rebased || e.outcome == RebaseState::Skipped) &&
            e.resultCommit != e.originalCommit) {
            rewritten = true;
        }
    }
    if (!rewritten) {
        return;
    }

    auto head = local.head();
    if (!head) {
        report.localUpdateError = head.error();
        return;
    }

    Expected<void> updated;
    if (completed && !head.value().detached()) {
        // Materialise the new tip before moving the branch: checkout diffs against HEAD
        const std::string& ref = head.value().ref;
        updated = local.checkout(report.newTip);
        if (updated) updated = local.updateBranch(ref, report.newTip);
        if (updated) updated = local.checkout(ref);
        if (updated) Logger::instance().info(ref + " now at " + report.newTip.substr(0, 9));
    } else {
        // Halted (or detached to begin with): park HEAD on the last good commit,
        // the branch keeps the original commits
        updated = local.checkout(report.newTip);
        if (updated && !completed) {
            Logger::instance().warn("HEAD detached at " + report.newTip.substr(0, 9) +
                                    "; the original branch is unchanged");
        }
    }
    if (!updated) {
        report.localUpdateError = updated.error();
    }
}

}
