#pragma once

#include "cli/ICommand.hpp"

namespace gitcl {

class RebaseCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "rebase"; }
    const char* description() const override { return "Rebase a stack of changes and upload new patch sets"; }
    const char* helpNameLine() const override { return "rebase - Rebase a change and its dependents"; }
    const char* helpSynopsis() const override { return "git-cl rebase [<change>] [--onto <ref>]"; }
    const char* helpDescription() const override {
        return "Replay <change> (default: the bottom of the local stack) and every change depending on it "
               "onto <ref>, one at a time, uploading each result as a new patch set. Changes already "
               "up to date on the right base are skipped. The first conflict or upload failure stops the "
               "run: later changes are reported BLOCKED, HEAD is detached at the last good commit and "
               "the branch keeps its old commits.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {{"--onto <ref>", "New base (default: <defaultremote>/<defaultbranch>)"}};
    }
};

}
