#pragma once

#include "cli/ICommand.hpp"

namespace gitcl {

class StatusCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "status"; }
    const char* description() const override { return "Show how local commits relate to their changes"; }
    const char* helpNameLine() const override { return "status - Reconcile the local stack with the review server"; }
    const char* helpSynopsis() const override { return "git-cl status [--onto <ref>]"; }
    const char* helpDescription() const override {
        return "List the commits between <ref> and HEAD, oldest first, each with its Change-Id and "
               "classification: new, up-to-date, needs-rebase, diverged, remote-ahead, or not-uploaded "
               "for commits without a Change-Id. Then print the dependency chains.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {{"--onto <ref>", "Base of the stack (default: <defaultremote>/<defaultbranch>)"}};
    }
};

}
