#include "cli/commands/SubmitCommand.hpp"

#include <iostream>

#include "cli/ChangeFormat.hpp"
#include "core/ChangeId.hpp"

namespace gitcl {

Expected<void> SubmitCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "submit takes exactly one change"};
    }
    const std::string& id = args.front();
    if (!ChangeId::isChangeId(id) && !ChangeId::isLegacyId(id)) {
        return Error{ErrorCode::InvalidArgs, "'" + id + "' is neither a Change-Id nor a change number"};
    }

    auto remote = ctx.openRemote();
    if (!remote) return remote.error();

    auto before = remote.value()->getChange(id);
    if (!before) return before.error();

    auto merged = remote.value()->submit(id);
    if (!merged) return merged.error();

    const PatchSet* current = merged.value().latest() ? merged.value().latest() : before.value().latest();
    std::cout << "Change " << before.value().changeId << " successfully merged";
    if (current) std::cout << " (" << ChangeFormat::shortHash(current->commitHash) << ")";
    std::cout << "\n";
    return {};
}

}
