// git-cl: command-line client for Gerrit code review.

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/ListCommand.hpp"
#include "cli/commands/RebaseCommand.hpp"
#include "cli/commands/ReviewCommand.hpp"
#include "cli/commands/StatusCommand.hpp"
#include "cli/commands/SubmitCommand.hpp"
#include "util/Config.hpp"
#include "util/Logger.hpp"

using namespace gitcl;

static void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("list", [] { return std::make_unique<ListCommand>(); });
    f.registerCreator("review", [] { return std::make_unique<ReviewCommand>(); });
    f.registerCreator("submit", [] { return std::make_unique<SubmitCommand>(); });
    f.registerCreator("status", [] { return std::make_unique<StatusCommand>(); });
    f.registerCreator("rebase", [] { return std::make_unique<RebaseCommand>(); });
    f.registerAlias("show", "review");
}

int main(int argc, char** argv) {
    registerCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    // Global options come before the subcommand
    while (!args.empty() && args.front().rfind("-", 0) == 0) {
        const std::string& opt = args.front();
        if (opt == "-v" || opt == "--verbose") {
            Logger::instance().setLevel(LogLevel::Debug);
        } else if (opt == "-q" || opt == "--quiet") {
            Logger::instance().setLevel(LogLevel::Error);
        } else if (opt == "-h" || opt == "--help") {
            args.front() = "help";
            break;
        } else {
            std::cerr << "error: " << errorCodeName(ErrorCode::InvalidArgs) << ": unknown option '" << opt << "'\n";
            return 1;
        }
        args.erase(args.begin());
    }

    AppContext ctx;
    CommandInvoker invoker;
    if (args.empty()) {
        auto help = CommandFactory::instance().create("help");
        return invoker.invoke(*help, ctx, {}) ? 0 : 1;
    }

    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        std::cerr << "error: " << errorCodeName(ErrorCode::InvalidArgs) << ": unknown command '" << cmdName
                  << "'; see 'git-cl help'\n";
        return 1;
    }

    std::error_code ec;
    ctx.workDir = std::filesystem::current_path(ec);
    if (cmdName != "help") {
        auto config = Config::loadGerritConfig(ctx.workDir, Config::homeDirectory());
        if (!config) {
            std::cerr << "error: " << errorCodeName(config.error().code) << ": " << config.error().message << "\n";
            return 1;
        }
        ctx.config = config.value();
    }

    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : 1;
}
