#include "cli/commands/HelpCommand.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"

namespace gitcl {

namespace {

void printCommandDetail(const ICommand& cmd) {
    std::cout << "NAME\n    " << cmd.helpNameLine() << "\n\n";
    std::cout << "SYNOPSIS\n    " << cmd.helpSynopsis() << "\n\n";
    std::cout << "DESCRIPTION\n    " << cmd.helpDescription() << "\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        std::cout << "\nOPTIONS\n";
        for (const auto& [opt, desc] : opts) {
            std::cout << "    " << opt << "\n        " << desc << "\n";
        }
    }
}

}

Expected<void> HelpCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    if (!args.empty()) {
        const std::string& topic = args.front();
        auto cmd = CommandFactory::instance().create(topic);
        if (!cmd) {
            return Error{ErrorCode::InvalidArgs, "no help for unknown command '" + topic + "'"};
        }
        printCommandDetail(*cmd);
        return {};
    }

    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);

    std::cout << "usage: git-cl [-v | -q] <command> [<args>]\n\n";
    std::cout << "Commands:\n";
    for (const auto& c : cmds) {
        std::cout << "  " << c->name() << "\t" << c->description() << "\n";
    }
    std::cout << "\nSee 'git-cl help <command>' for details.\n";
    return {};
}

}
