#include "core/RebaseSession.hpp"

#include "util/Logger.hpp"

namespace gitcl {

const char* rebaseStateName(RebaseState state) {
    switch (state) {
        case RebaseState::Unprocessed: return "UNPROCESSED";
        case RebaseState::Skipped: return "SKIPPED";
        case RebaseState::Rebasing: return "REBASING";
        case RebaseState::Rebased: return "REBASED";
        case RebaseState::Conflicted: return "CONFLICTED";
        case RebaseState::Failed: return "FAILED";
        case RebaseState::Blocked: return "BLOCKED";
    }
    return "UNKNOWN";
}

bool isTerminal(RebaseState state) {
    return state != RebaseState::Unprocessed && state != RebaseState::Rebasing;
}

RebaseSession::RebaseSession(const ChangeIndex& index, const DependencyChain& chain)
    : index(index), members(chain) {
    for (size_t m : members.members) {
        states[m] = RebaseState::Unprocessed;
    }
}

RebaseState RebaseSession::state(size_t member) const {
    auto it = states.find(member);
    return it == states.end() ? RebaseState::Unprocessed : it->second;
}

bool RebaseSession::finished() const {
    for (const auto& kv : states) {
        if (!isTerminal(kv.second)) return false;
    }
    return true;
}

bool RebaseSession::dependenciesDone(size_t member) const {
    auto dep = index.dependencyOf(member);
    if (!dep) return true;
    auto it = states.find(*dep);
    if (it == states.end()) return true;
    return it->second == RebaseState::Rebased || it->second == RebaseState::Skipped;
}

Expected<void> RebaseSession::transition(size_t member, RebaseState to) {
    auto it = states.find(member);
    if (it == states.end()) {
        return Error{ErrorCode::InvalidTransition, "change is not part of this rebase"};
    }
    RebaseState from = it->second;

    bool allowed = false;
    switch (from) {
        case RebaseState::Unprocessed:
            allowed = to == RebaseState::Skipped || to == RebaseState::Rebasing || to == RebaseState::Blocked;
            break;
        case RebaseState::Rebasing:
            allowed = to == RebaseState::Rebased || to == RebaseState::Conflicted || to == RebaseState::Failed;
            break;
        default:
            break;
    }
    const std::string& id = index.binding(member).changeId();
    if (!allowed) {
        return Error{ErrorCode::InvalidTransition, id + ": " + rebaseStateName(from) + " -> " + rebaseStateName(to)};
    }
    if ((to == RebaseState::Rebasing || to == RebaseState::Skipped) && !dependenciesDone(member)) {
        return Error{ErrorCode::InvalidTransition,
                     id + ": the change it depends on has not been rebased"};
    }

    it->second = to;
    Logger::instance().debug(id + ": " + rebaseStateName(from) + " -> " + rebaseStateName(to));
    return {};
}

}
