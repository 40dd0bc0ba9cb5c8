#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace gitcl {

class CommandInvoker {
public:
    /// Run `cmd`; a failure is reported on stderr as "error: <kind>: <message>"
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
