#pragma once

#include <ostream>
#include <string>

#include "core/Change.hpp"
#include "core/RebaseOrchestrator.hpp"

namespace gitcl {

/// Plain-text rendering shared by the commands
namespace ChangeFormat {

std::string shortHash(const std::string& hash);

/// "change-id", owner and subject lines, as in list output
void printSummary(std::ostream& out, const Change& change);

/// Summary plus project, status and the patch-set table
void printDetail(std::ostream& out, const Change& change);

void printReport(std::ostream& out, const RebaseReport& report);

}

}
