#include "core/Index.hpp"

#include <fstream>
#include <iterator>
#include <vector>

#include "core/Constants.hpp"
#include "util/IHasher.hpp"

namespace fs = std::filesystem;

namespace gitcl {

namespace {

constexpr size_t HEADER_SIZE = 12;
constexpr size_t ENTRY_FIXED_SIZE = 62;        // 10 * 4 stat fields + 20 sha1 + 2 flags
constexpr uint16_t FLAG_EXTENDED = 0x4000;
constexpr uint16_t NAME_MASK = 0x0fff;

void putBE32(std::string& out, uint32_t v) {
    out += static_cast<char>((v >> 24) & 0xff);
    out += static_cast<char>((v >> 16) & 0xff);
    out += static_cast<char>((v >> 8) & 0xff);
    out += static_cast<char>(v & 0xff);
}

void putBE16(std::string& out, uint16_t v) {
    out += static_cast<char>((v >> 8) & 0xff);
    out += static_cast<char>(v & 0xff);
}

uint32_t getBE32(const std::string& in, size_t pos) {
    return (static_cast<uint32_t>(static_cast<uint8_t>(in[pos])) << 24) |
           (static_cast<uint32_t>(static_cast<uint8_t>(in[pos + 1])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(in[pos + 2])) << 8) |
           static_cast<uint32_t>(static_cast<uint8_t>(in[pos + 3]));
}

uint16_t getBE16(const std::string& in, size_t pos) {
    return static_cast<uint16_t>((static_cast<uint8_t>(in[pos]) << 8) | static_cast<uint8_t>(in[pos + 1]));
}

Error corrupt(const std::string& what) {
    return Error{ErrorCode::CorruptObject, "corrupt index: " + what};
}

}

Expected<Index> Index::parse(const std::string& bytes) {
    if (bytes.size() < HEADER_SIZE + Constants::SHA1_RAW_LENGTH) {
        return corrupt("too short");
    }
    if (bytes.compare(0, 4, "DIRC") != 0) {
        return corrupt("bad signature");
    }
    uint32_t version = getBE32(bytes, 4);
    if (version != 2 && version != 3) {
        return Error{ErrorCode::CorruptObject, "unsupported index version " + std::to_string(version)};
    }

    // Trailer checksum covers everything before it
    size_t bodySize = bytes.size() - Constants::SHA1_RAW_LENGTH;
    auto hasher = HasherFactory::createDefault();
    hasher->update(reinterpret_cast<const uint8_t*>(bytes.data()), bodySize);
    std::vector<uint8_t> expected = hasher->digest();
    if (bytes.compare(bodySize, Constants::SHA1_RAW_LENGTH,
                      std::string(expected.begin(), expected.end())) != 0) {
        return corrupt("checksum mismatch");
    }

    uint32_t count = getBE32(bytes, 8);
    Index index;
    size_t pos = HEADER_SIZE;
    for (uint32_t i = 0; i < count; ++i) {
        if (pos + ENTRY_FIXED_SIZE > bodySize) {
            return corrupt("truncated entry");
        }
        IndexEntry e;
        e.ctimeNs = static_cast<uint64_t>(getBE32(bytes, pos)) * 1000000000ULL + getBE32(bytes, pos + 4);
        e.mtimeNs = static_cast<uint64_t>(getBE32(bytes, pos + 8)) * 1000000000ULL + getBE32(bytes, pos + 12);
        e.dev = getBE32(bytes, pos + 16);
        e.ino = getBE32(bytes, pos + 20);
        e.mode = getBE32(bytes, pos + 24);
        e.uid = getBE32(bytes, pos + 28);
        e.gid = getBE32(bytes, pos + 32);
        e.sizeBytes = getBE32(bytes, pos + 36);
        const auto* sha = reinterpret_cast<const uint8_t*>(bytes.data() + pos + 40);
        e.hashHex = IHasher::toHex(std::vector<uint8_t>(sha, sha + Constants::SHA1_RAW_LENGTH));
        uint16_t flags = getBE16(bytes, pos + 60);
        e.stage = static_cast<uint16_t>((flags >> 12) & 0x3);

        size_t nameStart = pos + ENTRY_FIXED_SIZE;
        if (flags & FLAG_EXTENDED) {
            if (version < 3) return corrupt("extended flags in version 2");
            nameStart += 2;
        }
        size_t nameEnd = bytes.find('\0', nameStart);
        if (nameEnd == std::string::npos || nameEnd >= bodySize) {
            return corrupt("unterminated path");
        }
        e.path = bytes.substr(nameStart, nameEnd - nameStart);

        // Entry length is padded with 1..8 NULs to a multiple of 8
        size_t entryLen = nameEnd - pos;
        size_t padded = (entryLen + 8) & ~static_cast<size_t>(7);
        pos += padded;

        index.pathToEntry[e.path] = e;
    }
    // Remaining bytes up to the trailer are extensions (TREE, REUC, ...), not needed here
    return index;
}

std::string Index::serialize() const {
    std::string out = "DIRC";
    putBE32(out, 2);
    putBE32(out, static_cast<uint32_t>(pathToEntry.size()));

    for (const auto& [path, e] : pathToEntry) {
        size_t start = out.size();
        putBE32(out, static_cast<uint32_t>(e.ctimeNs / 1000000000ULL));
        putBE32(out, static_cast<uint32_t>(e.ctimeNs % 1000000000ULL));
        putBE32(out, static_cast<uint32_t>(e.mtimeNs / 1000000000ULL));
        putBE32(out, static_cast<uint32_t>(e.mtimeNs % 1000000000ULL));
        putBE32(out, e.dev);
        putBE32(out, e.ino);
        putBE32(out, e.mode);
        putBE32(out, e.uid);
        putBE32(out, e.gid);
        putBE32(out, static_cast<uint32_t>(e.sizeBytes));

        std::vector<uint8_t> raw;
        IHasher::fromHex(e.hashHex, raw);
        raw.resize(Constants::SHA1_RAW_LENGTH, 0);
        out.append(reinterpret_cast<const char*>(raw.data()), raw.size());

        uint16_t nameLen = path.size() < NAME_MASK ? static_cast<uint16_t>(path.size()) : NAME_MASK;
        putBE16(out, static_cast<uint16_t>((e.stage & 0x3) << 12 | nameLen));
        out += path;

        size_t entryLen = out.size() - start;
        size_t padded = (entryLen + 8) & ~static_cast<size_t>(7);
        out.append(padded - entryLen, '\0');
    }

    auto hasher = HasherFactory::createDefault();
    hasher->update(out);
    std::vector<uint8_t> digest = hasher->digest();
    out.append(reinterpret_cast<const char*>(digest.data()), digest.size());
    return out;
}

Expected<void> Index::load(const fs::path& gitDir) {
    pathToEntry.clear();
    std::ifstream in(gitDir / "index", std::ios::binary);
    if (!in) {
        // No index yet (fresh clone with no checkout, or bare use)
        return {};
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IoError, "failed to read index"};
    }
    auto parsed = parse(bytes);
    if (!parsed) return parsed.error();
    pathToEntry = std::move(parsed.value().pathToEntry);
    return {};
}

Expected<void> Index::save(const fs::path& gitDir) const {
    fs::path indexPath = gitDir / "index";
    fs::path lockPath = gitDir / "index.lock";
    std::error_code ec;

    std::ofstream out(lockPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "failed to create " + lockPath.string()};
    }
    std::string image = serialize();
    out.write(image.data(), static_cast<std::streamsize>(image.size()));
    out.flush();
    if (!out) {
        out.close();
        fs::remove(lockPath, ec);
        return Error{ErrorCode::IoError, "failed to write index"};
    }
    out.close();

    fs::rename(lockPath, indexPath, ec);
    if (ec) {
        fs::remove(lockPath, ec);
        return Error{ErrorCode::IoError, "failed to update index: " + ec.message()};
    }
    return {};
}

void Index::addOrUpdate(const IndexEntry& entry) {
    pathToEntry[entry.path] = entry;
}

void Index::remove(const std::string& path) {
    pathToEntry.erase(path);
}

void Index::clear() {
    pathToEntry.clear();
}

}
