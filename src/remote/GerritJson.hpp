#pragma once

#include <string>
#include <vector>

#include "core/Change.hpp"
#include "util/Expected.hpp"

namespace gitcl {

/**
 * Decoding of Gerrit REST responses into the change model.
 *
 * Every response body starts with the XSSI guard line ")]}'" which must be
 * removed before the JSON is parsed.
 */
namespace GerritJson {

constexpr const char* XSSI_PREFIX = ")]}'";

/// Body without the guard line; ProtocolError when the guard is missing
Expected<std::string> stripXssi(const std::string& body);

/// A ChangeInfo object (with or without its revisions)
Expected<Change> parseChange(const std::string& body);

/// A JSON array of ChangeInfo objects
Expected<std::vector<Change>> parseChanges(const std::string& body);

/// Gerrit's JSON string body (e.g. the "message" of an error), else the text as is
std::string errorMessage(const std::string& body);

/// Decode a base64 body (the revision patch endpoint)
Expected<std::string> decodeBase64(const std::string& text);

}

}
