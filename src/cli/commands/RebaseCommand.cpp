#include "cli/commands/RebaseCommand.hpp"

#include <iostream>
#include <stdexcept>

#include "cli/ChangeFormat.hpp"
#include "core/ChangeId.hpp"
#include "core/RebaseOrchestrator.hpp"
#include "core/Reconciler.hpp"

namespace gitcl {

namespace {

Expected<size_t> selectStart(const ChangeIndex& index, const std::string& arg) {
    if (ChangeId::isChangeId(arg)) {
        auto found = index.find(arg);
        if (found) return *found;
    } else if (ChangeId::isLegacyId(arg)) {
        int number = 0;
        try {
            number = std::stoi(arg);
        } catch (const std::out_of_range&) {
            return Error{ErrorCode::NotFound, "change " + arg + " is not part of the local stack"};
        }
        for (size_t i = 0; i < index.size(); ++i) {
            const auto& change = index.binding(i).change;
            if (change && change->number == number) return i;
        }
    } else {
        return Error{ErrorCode::InvalidArgs, "'" + arg + "' is neither a Change-Id nor a change number"};
    }
    return Error{ErrorCode::NotFound, "change " + arg + " is not part of the local stack"};
}

/// Error describing why the walk stopped
Error haltError(const RebaseReport& report) {
    for (const auto& e : report.entries) {
        if (e.outcome == RebaseState::Conflicted) {
            return Error{ErrorCode::Conflict, e.changeId + " does not apply cleanly; resolve the conflict and rerun",
                         e.conflictPaths};
        }
        if (e.outcome == RebaseState::Failed && e.error) {
            return Error{e.error->code, e.changeId + ": " + e.error->message};
        }
    }
    if (report.localUpdateError) {
        return *report.localUpdateError;
    }
    return Error{ErrorCode::InternalError, "rebase did not complete"};
}

}

Expected<void> RebaseCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::string onto = ctx.upstreamRef();
    bool ontoGiven = false;
    std::string changeArg;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--onto") {
            if (i + 1 >= args.size()) return Error{ErrorCode::InvalidArgs, "--onto requires a value"};
            onto = args[++i];
            ontoGiven = true;
        } else if (args[i].rfind("--", 0) == 0 || !changeArg.empty()) {
            return Error{ErrorCode::InvalidArgs, "unexpected argument '" + args[i] + "'"};
        } else {
            changeArg = args[i];
        }
    }

    auto repo = ctx.openRepository();
    if (!repo) return repo.error();
    auto remote = ctx.openRemote();
    if (!remote) return remote.error();
    LocalRepository& local = *repo.value();

    // The target must resolve before its range is listed
    auto target = local.resolve(onto);
    if (!target) {
        return Error{ErrorCode::RefNotFound, "cannot resolve '" + onto + "'"};
    }

    Reconciler reconciler(local, *remote.value(), local.patchDiffer());
    auto index = reconciler.reconcile(onto + "..HEAD");
    if (!index) return index.error();

    DependencyChain chain;
    std::string base = onto;
    if (!changeArg.empty()) {
        auto start = selectStart(index.value(), changeArg);
        if (!start) return start.error();
        chain = index.value().chainFrom(start.value());

        // A change higher up the stack is rebased onto the local change it depends on
        auto below = index.value().dependencyOf(start.value());
        if (below && !ontoGiven) {
            base = index.value().binding(*below).commit.hash;
        }
    } else {
        auto chains = index.value().chains();
        if (chains.empty()) {
            if (!index.value().notUploaded().empty()) {
                return Error{ErrorCode::MissingChangeId, "no commit above " + onto + " carries a Change-Id"};
            }
            std::cout << "Nothing to rebase onto " << onto << "\n";
            return {};
        }
        chain = chains.front();
    }

    RebaseOrchestrator orchestrator(local, *remote.value());
    auto report = orchestrator.rebase(index.value(), chain, base);
    if (!report) return report.error();

    ChangeFormat::printReport(std::cout, report.value());
    if (!report.value().succeeded()) {
        return haltError(report.value());
    }
    return {};
}

}
