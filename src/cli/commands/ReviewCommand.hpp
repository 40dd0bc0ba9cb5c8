#pragma once

#include "cli/ICommand.hpp"

namespace gitcl {

class ReviewCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "review"; }
    const char* description() const override { return "Display one or more changes"; }
    const char* helpNameLine() const override { return "review - Fetch and display changes (alias: show)"; }
    const char* helpSynopsis() const override { return "git-cl review [--patch] <change>..."; }
    const char* helpDescription() const override {
        return "Print owner, subject, status and the patch sets of each change. A change is a Change-Id, "
               "a change number or an inclusive range of numbers N..M; unknown changes are skipped with a "
               "warning.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {{"--patch", "Also print the patch of the current patch set"}};
    }
};

}
