#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/LocalRepository.hpp"
#include "util/Expected.hpp"

namespace gitcl {

/// git's pkt-line framing: 4 hex digits of length (header included) then payload
namespace PktLine {

constexpr const char* FLUSH = "0000";
constexpr size_t MAX_PAYLOAD = 65516;

std::string encode(const std::string& payload);

/// Payloads of a pkt-line stream in order, trailing '\n' removed, flush packets dropped
Expected<std::vector<std::string>> decode(const std::string& stream);

}

namespace ReceivePack {

/// Refs and capabilities advertised by GET info/refs?service=git-receive-pack
struct Advertisement {
    std::map<std::string, std::string> refs;    // ref name -> object id
    std::vector<std::string> capabilities;

    bool supports(const std::string& capability) const;
};

Expected<Advertisement> parseAdvertisement(const std::string& body);

/// Request body: one command, flush, then the packfile
std::string buildRequest(const std::string& oldId, const std::string& newId, const std::string& ref,
                         const std::vector<std::string>& capabilities, const std::string& pack);

/**
 * @brief Check a report-status response for `ref`
 *
 * "unpack <error>" is a ProtocolError, "ng <ref> <reason>" a Conflict
 * carrying the server's reason.
 */
Expected<void> checkReportStatus(const std::string& body, const std::string& ref);

}

/**
 * @brief Version 2 packfile of undeltified objects
 *
 * "PACK", version, object count, then per object a type/size varint header
 * and the zlib-deflated payload; ends with the SHA-1 of everything before.
 */
class PackWriter {
public:
    static std::string build(const std::vector<PackObject>& objects);

private:
    static std::string entryHeader(ObjectType type, size_t size);
};

}
