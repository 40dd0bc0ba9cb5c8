#include "cli/commands/StatusCommand.hpp"

#include <iomanip>
#include <iostream>

#include "cli/ChangeFormat.hpp"
#include "core/Reconciler.hpp"

namespace gitcl {

Expected<void> StatusCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::string onto = ctx.upstreamRef();
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--onto" && i + 1 < args.size()) {
            onto = args[++i];
        } else {
            return Error{ErrorCode::InvalidArgs, "unexpected argument '" + args[i] + "'"};
        }
    }

    auto repo = ctx.openRepository();
    if (!repo) return repo.error();
    auto remote = ctx.openRemote();
    if (!remote) return remote.error();
    LocalRepository& local = *repo.value();

    const std::string range = onto + "..HEAD";
    Reconciler reconciler(local, *remote.value(), local.patchDiffer());
    auto index = reconciler.reconcile(range);
    if (!index) return index.error();
    auto commits = local.listCommits(range);
    if (!commits) return commits.error();

    auto head = local.head();
    if (!head) return head.error();
    if (head.value().detached()) {
        std::cout << "HEAD detached at " << ChangeFormat::shortHash(head.value().commit);
    } else {
        std::cout << "On branch " << head.value().ref.substr(std::string("refs/heads/").size());
    }
    std::cout << ", " << commits.value().size() << " commit(s) ahead of " << onto << "\n";

    if (commits.value().empty()) {
        return {};
    }
    std::cout << "\n";
    for (const auto& commit : commits.value()) {
        auto bound = index.value().findByCommit(commit.hash);
        const char* state = bound ? classificationName(index.value().binding(*bound).classification)
                                  : "not-uploaded";
        std::cout << "  " << ChangeFormat::shortHash(commit.hash) << "  " << std::left << std::setw(13) << state
                  << std::right << (commit.changeId ? *commit.changeId : std::string("-")) << "  "
                  << commit.subject << "\n";
    }

    auto chains = index.value().chains();
    if (!chains.empty()) {
        std::cout << "\nDependency chains:\n";
        for (const auto& chain : chains) {
            std::cout << " ";
            for (size_t i = 0; i < chain.members.size(); ++i) {
                std::cout << (i == 0 ? " " : " -> ") << index.value().binding(chain.members[i]).changeId();
            }
            std::cout << "\n";
        }
    }
    return {};
}

}
