#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gitcl {

namespace ChangeId {

/// "I" followed by 8 to 40 lowercase hex digits
bool isChangeId(const std::string& text);

/// Positive decimal change number
bool isLegacyId(const std::string& text);

/**
 * @brief Extract the Change-Id trailer from a commit message
 *
 * Only the last paragraph is searched, as git's trailer rules require. When
 * several Change-Id lines are present the last one wins, matching Gerrit.
 */
std::optional<std::string> fromCommitMessage(const std::string& message);

/**
 * @brief Expand command-line change arguments
 *
 * Accepts Change-Ids, legacy numbers and inclusive ranges "N..M". Invalid
 * forms are logged as warnings and skipped; duplicates are dropped with
 * first occurrence kept.
 */
std::vector<std::string> expandArguments(const std::vector<std::string>& args);

}

}
