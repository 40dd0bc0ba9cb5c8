#include "remote/GitProtocol.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <stdexcept>

#include "util/Compression.hpp"
#include "util/IHasher.hpp"

namespace gitcl {

namespace PktLine {

std::string encode(const std::string& payload) {
    char length[5];
    std::snprintf(length, sizeof(length), "%04x", static_cast<unsigned>(payload.size() + 4));
    return std::string(length, 4) + payload;
}

Expected<std::vector<std::string>> decode(const std::string& stream) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < stream.size()) {
        if (pos + 4 > stream.size()) {
            return Error{ErrorCode::ProtocolError, "truncated pkt-line header"};
        }
        size_t length = 0;
        try {
            size_t used = 0;
            length = std::stoul(stream.substr(pos, 4), &used, 16);
            if (used != 4) throw std::invalid_argument("pkt-line");
        } catch (const std::exception&) {
            return Error{ErrorCode::ProtocolError, "invalid pkt-line length '" + stream.substr(pos, 4) + "'"};
        }
        if (length == 0 || length == 1 || length == 2) {
            // flush / delim / response-end
            pos += 4;
            continue;
        }
        if (length < 4 || pos + length > stream.size()) {
            return Error{ErrorCode::ProtocolError, "truncated pkt-line"};
        }
        std::string payload = stream.substr(pos + 4, length - 4);
        if (!payload.empty() && payload.back() == '\n') payload.pop_back();
        lines.push_back(std::move(payload));
        pos += length;
    }
    return lines;
}

}

namespace ReceivePack {

bool Advertisement::supports(const std::string& capability) const {
    return std::find(capabilities.begin(), capabilities.end(), capability) != capabilities.end();
}

Expected<Advertisement> parseAdvertisement(const std::string& body) {
    auto lines = PktLine::decode(body);
    if (!lines) return lines.error();

    Advertisement adv;
    bool first = true;
    for (const auto& line : lines.value()) {
        if (line.rfind("# service=", 0) == 0) continue;

        std::string refPart = line;
        if (first) {
            // Capabilities follow the first ref after a NUL
            size_t nul = line.find('\0');
            if (nul != std::string::npos) {
                refPart = line.substr(0, nul);
                std::istringstream caps(line.substr(nul + 1));
                std::string cap;
                while (caps >> cap) adv.capabilities.push_back(cap);
            }
            first = false;
        }
        size_t space = refPart.find(' ');
        if (space != 40) {
            return Error{ErrorCode::ProtocolError, "malformed ref advertisement: " + refPart};
        }
        std::string name = refPart.substr(space + 1);
        if (name != "capabilities^{}") {
            adv.refs[name] = refPart.substr(0, space);
        }
    }
    return adv;
}

std::string buildRequest(const std::string& oldId, const std::string& newId, const std::string& ref,
                         const std::vector<std::string>& capabilities, const std::string& pack) {
    std::string command = oldId + " " + newId + " " + ref;
    command += '\0';
    for (size_t i = 0; i < capabilities.size(); ++i) {
        if (i > 0) command += ' ';
        command += capabilities[i];
    }
    command += '\n';
    return PktLine::encode(command) + PktLine::FLUSH + pack;
}

Expected<void> checkReportStatus(const std::string& body, const std::string& ref) {
    auto lines = PktLine::decode(body);
    if (!lines) return lines.error();
    if (lines.value().empty()) {
        return Error{ErrorCode::ProtocolError, "empty receive-pack response"};
    }

    bool unpacked = false;
    bool reported = false;
    for (const auto& line : lines.value()) {
        if (line.rfind("unpack ", 0) == 0) {
            if (line != "unpack ok") {
                return Error{ErrorCode::ProtocolError, "server failed to unpack: " + line.substr(7)};
            }
            unpacked = true;
        } else if (line.rfind("ok ", 0) == 0 && line.substr(3) == ref) {
            reported = true;
        } else if (line.rfind("ng ", 0) == 0) {
            std::string rest = line.substr(3);
            size_t space = rest.find(' ');
            std::string reason = space == std::string::npos ? std::string("rejected") : rest.substr(space + 1);
            return Error{ErrorCode::Conflict, "push to " + rest.substr(0, space) + " rejected: " + reason};
        }
    }
    if (!unpacked || !reported) {
        return Error{ErrorCode::ProtocolError, "incomplete report-status for " + ref};
    }
    return {};
}

}

std::string PackWriter::entryHeader(ObjectType type, size_t size) {
    std::string header;
    uint8_t c = static_cast<uint8_t>((static_cast<unsigned>(type) << 4) | (size & 0x0f));
    size >>= 4;
    while (size != 0) {
        header.push_back(static_cast<char>(c | 0x80));
        c = static_cast<uint8_t>(size & 0x7f);
        size >>= 7;
    }
    header.push_back(static_cast<char>(c));
    return header;
}

std::string PackWriter::build(const std::vector<PackObject>& objects) {
    std::string pack = "PACK";
    auto putUint32 = [&pack](uint32_t v) {
        pack.push_back(static_cast<char>((v >> 24) & 0xff));
        pack.push_back(static_cast<char>((v >> 16) & 0xff));
        pack.push_back(static_cast<char>((v >> 8) & 0xff));
        pack.push_back(static_cast<char>(v & 0xff));
    };
    putUint32(2);
    putUint32(static_cast<uint32_t>(objects.size()));

    for (const auto& obj : objects) {
        pack += entryHeader(obj.type, obj.payload.size());
        std::vector<uint8_t> deflated = zlibCompress(obj.payload);
        pack.append(reinterpret_cast<const char*>(deflated.data()), deflated.size());
    }

    auto hasher = HasherFactory::createDefault();
    hasher->update(pack);
    std::vector<uint8_t> trailer = hasher->digest();
    pack.append(reinterpret_cast<const char*>(trailer.data()), trailer.size());
    return pack;
}

}
