#pragma once

#include "cli/ICommand.hpp"

namespace gitcl {

class ListCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "list"; }
    const char* description() const override { return "List changes on the review server"; }
    const char* helpNameLine() const override { return "list - List changes by owner and status"; }
    const char* helpSynopsis() const override {
        return "git-cl list [--status <status>] [--owner <owner> | --watched] [--branch <branch>]";
    }
    const char* helpDescription() const override {
        return "Query the review server and print the Change-Id, number, owner and subject of every "
               "matching change. An empty result is not an error.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--status <status>", "open (default), merged, abandoned, closed, reviewed or submitted"},
            {"--owner <owner>", "Owner of the changes (default: self)"},
            {"--watched", "List watched changes instead of owned ones"},
            {"--branch <branch>", "Only changes targeting this branch"},
        };
    }
};

}
