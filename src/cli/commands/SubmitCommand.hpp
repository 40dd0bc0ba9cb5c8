#pragma once

#include "cli/ICommand.hpp"

namespace gitcl {

class SubmitCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "submit"; }
    const char* description() const override { return "Merge a change"; }
    const char* helpNameLine() const override { return "submit - Submit a change for merging"; }
    const char* helpSynopsis() const override { return "git-cl submit <change>"; }
    const char* helpDescription() const override {
        return "Ask the server to merge the current patch set of the change and wait for the merge. "
               "Fails with not-ready when the change cannot be merged yet and with conflict when it no "
               "longer applies to its branch.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
