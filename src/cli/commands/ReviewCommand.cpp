#include "cli/commands/ReviewCommand.hpp"

#include <iostream>

#include "cli/ChangeFormat.hpp"
#include "core/ChangeId.hpp"
#include "util/Logger.hpp"

namespace gitcl {

Expected<void> ReviewCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    bool withPatch = false;
    std::vector<std::string> changeArgs;
    for (const auto& arg : args) {
        if (arg == "--patch") {
            withPatch = true;
        } else if (arg.rfind("--", 0) == 0) {
            return Error{ErrorCode::InvalidArgs, "unknown option '" + arg + "'"};
        } else {
            changeArgs.push_back(arg);
        }
    }
    if (changeArgs.empty()) {
        return Error{ErrorCode::InvalidArgs, "missing change argument"};
    }

    std::vector<std::string> ids = ChangeId::expandArguments(changeArgs);
    if (ids.empty()) {
        return Error{ErrorCode::NotFound, "no valid change given"};
    }

    auto remote = ctx.openRemote();
    if (!remote) return remote.error();

    size_t shown = 0;
    for (const auto& id : ids) {
        auto change = remote.value()->getChange(id);
        if (!change) {
            if (change.error().code == ErrorCode::NotFound) {
                Logger::instance().warn("skipping " + id + ": " + change.error().message);
                continue;
            }
            return change.error();
        }

        if (shown++ > 0) std::cout << "\n";
        ChangeFormat::printDetail(std::cout, change.value());

        const PatchSet* latest = change.value().latest();
        if (withPatch && latest) {
            auto patch = remote.value()->getPatch(id, latest->commitHash);
            if (!patch) return patch.error();
            std::cout << "\n" << patch.value();
        }
    }
    if (shown == 0) {
        return Error{ErrorCode::NotFound, "none of the given changes exist"};
    }
    return {};
}

}
