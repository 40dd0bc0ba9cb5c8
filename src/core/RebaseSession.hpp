#pragma once

#include <map>
#include <vector>

#include "core/ChangeIndex.hpp"
#include "util/Expected.hpp"

namespace gitcl {

enum class RebaseState { Unprocessed, Skipped, Rebasing, Rebased, Conflicted, Failed, Blocked };

/// Uppercase report name ("REBASED")
const char* rebaseStateName(RebaseState state);

bool isTerminal(RebaseState state);

/**
 * @brief Per-change state machine of one rebase run
 *
 *   UNPROCESSED -> SKIPPED | REBASING | BLOCKED
 *   REBASING    -> REBASED | CONFLICTED | FAILED
 *
 * SKIPPED and REBASING are only reachable once every dependency inside the
 * session is REBASED or SKIPPED. Dependencies outside the chain count as
 * satisfied: they are the chain's base.
 */
class RebaseSession {
public:
    RebaseSession(const ChangeIndex& index, const DependencyChain& chain);

    /// InvalidTransition when the move is not allowed
    Expected<void> transition(size_t member, RebaseState to);

    RebaseState state(size_t member) const;
    const DependencyChain& chain() const { return members; }

    /// All members in a terminal state
    bool finished() const;

private:
    const ChangeIndex& index;
    DependencyChain members;
    std::map<size_t, RebaseState> states;

    bool dependenciesDone(size_t member) const;
};

}
