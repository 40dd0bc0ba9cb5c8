#include "cli/CommandInvoker.hpp"

#include <iostream>

#include "util/Logger.hpp"

namespace gitcl {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        const Error& err = res.error();
        std::cerr << "error: " << errorCodeName(err.code) << ": " << err.message << "\n";
        for (const auto& path : err.paths) {
            std::cerr << "  " << path << "\n";
        }
        return res;
    }
    return {};
}

}
