#include "core/PackReader.hpp"

#include <fstream>
#include <iterator>

#include "core/Constants.hpp"
#include "util/Compression.hpp"
#include "util/IHasher.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitcl {

namespace {

constexpr int MAX_DELTA_DEPTH = 64;
constexpr int OBJ_OFS_DELTA = 6;
constexpr int OBJ_REF_DELTA = 7;

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path.string());
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("cannot read " + path.string());
    }
    return bytes;
}

uint32_t be32(const std::string& s, size_t pos) {
    return (static_cast<uint32_t>(static_cast<uint8_t>(s[pos])) << 24) |
           (static_cast<uint32_t>(static_cast<uint8_t>(s[pos + 1])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(s[pos + 2])) << 8) |
           static_cast<uint32_t>(static_cast<uint8_t>(s[pos + 3]));
}

uint8_t byteAt(const std::string& s, size_t pos) {
    if (pos >= s.size()) {
        throw std::runtime_error("truncated pack data");
    }
    return static_cast<uint8_t>(s[pos]);
}

/// Little-endian base-128 size used in delta headers
uint64_t deltaVarint(const std::string& delta, size_t& pos) {
    uint64_t value = 0;
    int shift = 0;
    uint8_t c;
    do {
        c = byteAt(delta, pos++);
        value |= static_cast<uint64_t>(c & 0x7f) << shift;
        shift += 7;
    } while (c & 0x80);
    return value;
}

}

std::string applyDelta(const std::string& base, const std::string& delta) {
    size_t pos = 0;
    uint64_t srcSize = deltaVarint(delta, pos);
    uint64_t dstSize = deltaVarint(delta, pos);
    if (srcSize != base.size()) {
        throw std::runtime_error("delta base size mismatch");
    }

    std::string out;
    out.reserve(static_cast<size_t>(dstSize));
    while (pos < delta.size()) {
        uint8_t op = byteAt(delta, pos++);
        if (op & 0x80) {
            // Copy from base: offset and size bytes present per flag bit
            uint64_t offset = 0;
            uint64_t size = 0;
            for (int i = 0; i < 4; ++i) {
                if (op & (1 << i)) offset |= static_cast<uint64_t>(byteAt(delta, pos++)) << (8 * i);
            }
            for (int i = 0; i < 3; ++i) {
                if (op & (0x10 << i)) size |= static_cast<uint64_t>(byteAt(delta, pos++)) << (8 * i);
            }
            if (size == 0) size = 0x10000;
            if (offset + size > base.size()) {
                throw std::runtime_error("delta copy out of range");
            }
            out.append(base, static_cast<size_t>(offset), static_cast<size_t>(size));
        } else if (op != 0) {
            if (pos + op > delta.size()) {
                throw std::runtime_error("delta insert out of range");
            }
            out.append(delta, pos, op);
            pos += op;
        } else {
            throw std::runtime_error("reserved delta opcode");
        }
    }
    if (out.size() != dstSize) {
        throw std::runtime_error("delta result size mismatch");
    }
    return out;
}

PackReader::PackReader(const fs::path& objectsDir) {
    fs::path packDir = objectsDir / "pack";
    std::error_code ec;
    if (!fs::is_directory(packDir, ec)) return;

    for (const auto& entry : fs::directory_iterator(packDir, ec)) {
        if (entry.path().extension() != ".idx") continue;
        fs::path packPath = entry.path();
        packPath.replace_extension(".pack");
        if (!fs::exists(packPath, ec)) continue;
        packs.push_back(Pack{packPath, std::nullopt});
        loadIndex(entry.path(), packs.size() - 1);
    }
    if (!packs.empty()) {
        Logger::instance().debug("indexed " + std::to_string(locations.size()) + " packed object(s) in " +
                                 std::to_string(packs.size()) + " pack(s)");
    }
}

void PackReader::loadIndex(const fs::path& idxPath, size_t packNo) {
    std::string idx = readFile(idxPath);
    const size_t headerSize = 8;
    const size_t fanoutSize = 256 * 4;
    if (idx.size() < headerSize + fanoutSize || idx.compare(0, 4, "\377tOc") != 0 || be32(idx, 4) != 2) {
        throw std::runtime_error("unsupported pack index " + idxPath.string());
    }
    uint32_t count = be32(idx, headerSize + 255 * 4);
    size_t namesAt = headerSize + fanoutSize;
    size_t crcAt = namesAt + static_cast<size_t>(count) * Constants::SHA1_RAW_LENGTH;
    size_t offsetsAt = crcAt + static_cast<size_t>(count) * 4;
    size_t largeAt = offsetsAt + static_cast<size_t>(count) * 4;
    if (idx.size() < largeAt + 2 * Constants::SHA1_RAW_LENGTH) {
        throw std::runtime_error("truncated pack index " + idxPath.string());
    }

    for (uint32_t i = 0; i < count; ++i) {
        const auto* raw = reinterpret_cast<const uint8_t*>(idx.data() + namesAt + i * Constants::SHA1_RAW_LENGTH);
        std::string hash = IHasher::toHex(std::vector<uint8_t>(raw, raw + Constants::SHA1_RAW_LENGTH));

        uint64_t offset = be32(idx, offsetsAt + i * 4);
        if (offset & 0x80000000u) {
            size_t large = largeAt + static_cast<size_t>(offset & 0x7fffffffu) * 8;
            if (large + 8 > idx.size()) {
                throw std::runtime_error("bad large offset in " + idxPath.string());
            }
            offset = (static_cast<uint64_t>(be32(idx, large)) << 32) | be32(idx, large + 4);
        }
        // First pack wins for objects present in several
        locations.emplace(hash, Location{packNo, offset});
    }
}

bool PackReader::contains(const std::string& hash) const {
    return locations.count(hash) != 0;
}

const std::string& PackReader::packData(size_t packNo) const {
    const Pack& pack = packs[packNo];
    if (!pack.data) {
        pack.data = readFile(pack.packPath);
        if (pack.data->size() < 12 || pack.data->compare(0, 4, "PACK") != 0) {
            throw std::runtime_error("not a pack file: " + pack.packPath.string());
        }
    }
    return *pack.data;
}

RawObject PackReader::read(const std::string& hash, const ObjectStore& fallback) const {
    auto it = locations.find(hash);
    if (it == locations.end()) {
        throw ObjectNotFoundError(hash);
    }
    return readAt(it->second.pack, it->second.offset, fallback, 0);
}

RawObject PackReader::readAt(size_t packNo, uint64_t offset, const ObjectStore& fallback, int depth) const {
    if (depth > MAX_DELTA_DEPTH) {
        throw std::runtime_error("delta chain too long");
    }
    const std::string& data = packData(packNo);
    size_t pos = static_cast<size_t>(offset);

    // Entry header: type in bits 4-6 of the first byte, size as base-128 continuation
    uint8_t c = byteAt(data, pos++);
    int type = (c >> 4) & 0x7;
    uint64_t size = c & 0x0f;
    int shift = 4;
    while (c & 0x80) {
        c = byteAt(data, pos++);
        size |= static_cast<uint64_t>(c & 0x7f) << shift;
        shift += 7;
    }

    if (type == OBJ_OFS_DELTA || type == OBJ_REF_DELTA) {
        RawObject base;
        if (type == OBJ_OFS_DELTA) {
            c = byteAt(data, pos++);
            uint64_t back = c & 0x7f;
            while (c & 0x80) {
                c = byteAt(data, pos++);
                back = ((back + 1) << 7) | (c & 0x7f);
            }
            if (back == 0 || back > offset) {
                throw std::runtime_error("bad delta base offset");
            }
            base = readAt(packNo, offset - back, fallback, depth + 1);
        } else {
            if (pos + Constants::SHA1_RAW_LENGTH > data.size()) {
                throw std::runtime_error("truncated delta base id");
            }
            const auto* raw = reinterpret_cast<const uint8_t*>(data.data() + pos);
            std::string baseHash = IHasher::toHex(std::vector<uint8_t>(raw, raw + Constants::SHA1_RAW_LENGTH));
            pos += Constants::SHA1_RAW_LENGTH;
            auto baseLoc = locations.find(baseHash);
            base = baseLoc != locations.end()
                       ? readAt(baseLoc->second.pack, baseLoc->second.offset, fallback, depth + 1)
                       : fallback.readObject(baseHash);
        }
        size_t consumed = 0;
        std::string delta = zlibInflateEmbedded(reinterpret_cast<const uint8_t*>(data.data() + pos),
                                                data.size() - pos, static_cast<size_t>(size), consumed);
        RawObject obj;
        obj.type = base.type;
        obj.payload = applyDelta(base.payload, delta);
        return obj;
    }

    if (type < 1 || type > 4) {
        throw std::runtime_error("unknown packed object type " + std::to_string(type));
    }
    size_t consumed = 0;
    RawObject obj;
    obj.type = static_cast<ObjectType>(type);
    obj.payload = zlibInflateEmbedded(reinterpret_cast<const uint8_t*>(data.data() + pos), data.size() - pos,
                                      static_cast<size_t>(size), consumed);
    return obj;
}

}
