#include "cli/commands/ListCommand.hpp"

#include <algorithm>
#include <array>
#include <iostream>

#include "cli/ChangeFormat.hpp"
#include "util/Logger.hpp"

namespace gitcl {

namespace {

constexpr std::array<const char*, 6> STATUSES = {"open", "merged", "abandoned", "closed", "reviewed", "submitted"};

}

Expected<void> ListCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    ChangeQuery query;
    bool ownerGiven = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto needValue = [&](const char* flag) -> Expected<std::string> {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, std::string(flag) + " requires a value"};
            }
            return args[++i];
        };

        if (arg == "--status") {
            auto v = needValue("--status");
            if (!v) return v.error();
            if (std::find(STATUSES.begin(), STATUSES.end(), v.value()) == STATUSES.end()) {
                return Error{ErrorCode::InvalidArgs, "invalid status '" + v.value() + "'"};
            }
            query.status = v.value();
        } else if (arg == "--owner") {
            auto v = needValue("--owner");
            if (!v) return v.error();
            query.owner = v.value();
            ownerGiven = true;
        } else if (arg == "--watched") {
            query.watched = true;
        } else if (arg == "--branch") {
            auto v = needValue("--branch");
            if (!v) return v.error();
            query.branch = v.value();
        } else {
            return Error{ErrorCode::InvalidArgs, "unknown option '" + arg + "'"};
        }
    }
    if (ownerGiven && query.watched) {
        return Error{ErrorCode::InvalidArgs, "--owner and --watched are mutually exclusive"};
    }

    auto remote = ctx.openRemote();
    if (!remote) return remote.error();
    auto changes = remote.value()->listChanges(query);
    if (!changes) return changes.error();

    if (changes.value().empty()) {
        Logger::instance().debug("no matching change");
        return {};
    }
    bool first = true;
    for (const auto& change : changes.value()) {
        if (!first) std::cout << "\n";
        first = false;
        ChangeFormat::printSummary(std::cout, change);
    }
    return {};
}

}
