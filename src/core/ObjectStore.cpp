#include "core/ObjectStore.hpp"

#include <fstream>
#include <iterator>
#include <sstream>

#include "core/Constants.hpp"
#include "core/PackReader.hpp"
#include "util/Compression.hpp"
#include "util/IHasher.hpp"

namespace fs = std::filesystem;

namespace gitcl {

namespace {

std::string readAll(std::ifstream& in, const std::string& what) {
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("Error reading " + what);
    }
    return bytes;
}

ObjectType parseTypeName(const std::string& name, const std::string& hash) {
    if (name == "blob") return ObjectType::Blob;
    if (name == "tree") return ObjectType::Tree;
    if (name == "commit") return ObjectType::Commit;
    if (name == "tag") return ObjectType::Tag;
    throw std::runtime_error("Unknown object type '" + name + "' in " + hash);
}

/// "Name <email> 1700000000 +0100"
void parseIdent(const std::string& text, std::string& name, std::string& email,
                int64_t& timestamp, std::string& timezone) {
    size_t emailStart = text.find('<');
    size_t emailEnd = text.rfind('>');
    if (emailStart == std::string::npos || emailEnd == std::string::npos || emailEnd < emailStart) {
        return;
    }
    name = text.substr(0, emailStart);
    while (!name.empty() && name.back() == ' ') name.pop_back();
    email = text.substr(emailStart + 1, emailEnd - emailStart - 1);
    if (emailEnd + 1 < text.size()) {
        std::istringstream rest(text.substr(emailEnd + 1));
        rest >> timestamp >> timezone;
    }
}

}

const char* objectTypeName(ObjectType type) {
    switch (type) {
        case ObjectType::Commit: return "commit";
        case ObjectType::Tree: return "tree";
        case ObjectType::Blob: return "blob";
        case ObjectType::Tag: return "tag";
    }
    return "unknown";
}

bool treeEntryLess(const TreeEntry& a, const TreeEntry& b) {
    std::string ka = a.isTree ? a.name + "/" : a.name;
    std::string kb = b.isTree ? b.name + "/" : b.name;
    return ka < kb;
}

ObjectStore::ObjectStore(const fs::path& gitDir, std::unique_ptr<IHasher> hasher)
    : gitDir(gitDir), hasher(hasher ? std::move(hasher) : HasherFactory::createDefault()) {}

ObjectStore::~ObjectStore() = default;

ObjectStore::ObjectStore(ObjectStore&&) noexcept = default;
ObjectStore& ObjectStore::operator=(ObjectStore&&) noexcept = default;

fs::path ObjectStore::objectsDir() const {
    return gitDir / "objects";
}

fs::path ObjectStore::getObjectPath(const std::string& hash) const {
    if (hash.length() != Constants::SHA1_HEX_LENGTH) {
        throw std::runtime_error("Invalid object id: " + hash);
    }
    std::string dir = hash.substr(0, Constants::OBJECT_DIR_LENGTH);
    std::string file = hash.substr(Constants::OBJECT_DIR_LENGTH);
    return objectsDir() / dir / file;
}

const PackReader& ObjectStore::packReader() const {
    if (!packs) {
        packs = std::make_unique<PackReader>(objectsDir());
    }
    return *packs;
}

bool ObjectStore::hasObject(const std::string& hash) const {
    if (hash.length() != Constants::SHA1_HEX_LENGTH) return false;
    std::error_code ec;
    return fs::exists(getObjectPath(hash), ec) || packReader().contains(hash);
}

std::string ObjectStore::hashObject(ObjectType type, const std::string& payload) {
    std::string header = std::string(objectTypeName(type)) + " " + std::to_string(payload.size());
    header += '\0';
    hasher->reset();
    hasher->update(header);
    hasher->update(payload);
    return hasher->hexDigest();
}

std::string ObjectStore::writeObject(ObjectType type, const std::string& payload) {
    std::string hash = hashObject(type, payload);
    if (hasObject(hash)) {
        return hash;
    }
    fs::path objPath = getObjectPath(hash);

    std::error_code ec;

    fs::create_directories(objPath.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Failed to create object directory: " + ec.message());
    }

    std::string header = std::string(objectTypeName(type)) + " " + std::to_string(payload.size());
    header += '\0';
    std::vector<uint8_t> compressed = zlibCompress(header + payload);

    // Write beside the final name, then rename, so readers never see a partial object
    fs::path tmpPath = objPath;
    tmpPath += ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Failed to open object file for writing: " + hash);
        }
        out.write(reinterpret_cast<const char*>(compressed.data()),
                  static_cast<std::streamsize>(compressed.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmpPath, ec);
            throw std::runtime_error("Failed to write object: " + hash);
        }
    }
    fs::rename(tmpPath, objPath, ec);
    if (ec) {
        fs::remove(tmpPath, ec);
        throw std::runtime_error("Failed to store object: " + hash);
    }
    return hash;
}

std::string ObjectStore::writeBlob(const std::string& bytes) {
    return writeObject(ObjectType::Blob, bytes);
}

std::string ObjectStore::writeBlobFromFile(const fs::path& filePath) {
    std::ifstream in(filePath, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open file for reading: " + filePath.string());
    }
    return writeBlob(readAll(in, filePath.string()));
}

std::string ObjectStore::writeTree(const std::string& content) {
    return writeObject(ObjectType::Tree, content);
}

std::string ObjectStore::writeCommit(const CommitObject& commit) {
    return writeObject(ObjectType::Commit, commit.serialize());
}

std::string ObjectStore::hashFileContent(const fs::path& filePath) {
    std::error_code ec;
    if (fs::is_symlink(fs::symlink_status(filePath, ec))) {
        fs::path target = fs::read_symlink(filePath, ec);
        if (ec) {
            throw std::runtime_error("Failed to read symlink: " + filePath.string());
        }
        return hashObject(ObjectType::Blob, target.string());
    }
    std::ifstream in(filePath, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open file for hashing: " + filePath.string());
    }
    return hashObject(ObjectType::Blob, readAll(in, filePath.string()));
}

RawObject ObjectStore::readObject(const std::string& hash) const {
    if (hash.length() != Constants::SHA1_HEX_LENGTH) {
        throw ObjectNotFoundError(hash);
    }
    fs::path objPath = getObjectPath(hash);
    std::error_code ec;
    if (!fs::exists(objPath, ec)) {
        return packReader().read(hash, *this);
    }

    std::ifstream in(objPath, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open object file for reading: " + hash);
    }
    std::string raw = readAll(in, "object " + hash);
    if (raw.empty()) {
        throw std::runtime_error("Object file is empty: " + hash);
    }
    std::string full = zlibDecompress(std::vector<uint8_t>(raw.begin(), raw.end()));

    size_t headerEnd = full.find('\0');
    size_t space = full.find(' ');
    if (headerEnd == std::string::npos || space == std::string::npos || space > headerEnd) {
        throw std::runtime_error("Invalid object header: " + hash);
    }

    RawObject obj;
    obj.type = parseTypeName(full.substr(0, space), hash);
    size_t declared = 0;
    try {
        declared = static_cast<size_t>(std::stoull(full.substr(space + 1, headerEnd - space - 1)));
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid object size: " + hash);
    }
    obj.payload = full.substr(headerEnd + 1);
    if (obj.payload.size() != declared) {
        throw std::runtime_error("Object size mismatch: " + hash);
    }
    return obj;
}

std::string ObjectStore::readBlob(const std::string& hash) const {
    RawObject obj = readObject(hash);
    if (obj.type != ObjectType::Blob) {
        throw std::runtime_error("Not a blob object: " + hash);
    }
    return obj.payload;
}

CommitObject ObjectStore::readCommit(const std::string& hash) const {
    RawObject obj = readObject(hash);
    if (obj.type != ObjectType::Commit) {
        throw std::runtime_error("Not a commit object: " + hash);
    }
    const std::string& content = obj.payload;

    CommitObject commit;
    commit.hash = hash;

    // Headers end at the first blank line; the rest is the message verbatim
    size_t split = content.find("\n\n");
    std::string headers = split == std::string::npos ? content : content.substr(0, split + 1);
    commit.message = split == std::string::npos ? std::string() : content.substr(split + 2);

    std::istringstream iss(headers);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.empty()) continue;

        if (line[0] == ' ' && !commit.extraHeaders.empty()) {
            // Continuation of a multi-line header (gpgsig)
            commit.extraHeaders.back() += "\n" + line;
        } else if (line.rfind("tree ", 0) == 0) {
            commit.treeHash = line.substr(5);
            if (commit.treeHash.length() != Constants::SHA1_HEX_LENGTH) {
                throw std::runtime_error("Invalid tree hash length in commit: " + hash);
            }
        } else if (line.rfind("parent ", 0) == 0) {
            std::string parent = line.substr(7);
            if (parent.length() != Constants::SHA1_HEX_LENGTH) {
                throw std::runtime_error("Invalid parent hash length in commit: " + hash);
            }
            commit.parentHashes.push_back(parent);
        } else if (line.rfind("author ", 0) == 0) {
            parseIdent(line.substr(7), commit.authorName, commit.authorEmail,
                       commit.authorTimestamp, commit.authorTimezone);
        } else if (line.rfind("committer ", 0) == 0) {
            parseIdent(line.substr(10), commit.committerName, commit.committerEmail,
                       commit.committerTimestamp, commit.committerTimezone);
        } else {
            commit.extraHeaders.push_back(line);
        }
    }

    if (commit.treeHash.empty()) {
        throw std::runtime_error("Commit without tree: " + hash);
    }
    return commit;
}

std::vector<TreeEntry> ObjectStore::readTree(const std::string& hash) const {
    RawObject obj = readObject(hash);
    if (obj.type != ObjectType::Tree) {
        throw std::runtime_error("Not a tree object: " + hash);
    }
    const std::string& content = obj.payload;

    std::vector<TreeEntry> entries;
    size_t pos = 0;

    // Tree format: <octal-mode> <name>\0<20-byte-binary-hash>
    while (pos < content.size()) {
        TreeEntry entry;

        size_t spacePos = content.find(' ', pos);
        if (spacePos == std::string::npos) {
            throw std::runtime_error("Invalid tree entry: missing mode in " + hash);
        }
        try {
            entry.mode = static_cast<uint32_t>(std::stoul(content.substr(pos, spacePos - pos), nullptr, 8));
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid tree entry mode in " + hash);
        }

        size_t nullPos = content.find('\0', spacePos + 1);
        if (nullPos == std::string::npos) {
            throw std::runtime_error("Invalid tree entry: missing null terminator in " + hash);
        }
        entry.name = content.substr(spacePos + 1, nullPos - spacePos - 1);
        entry.isTree = (entry.mode == Constants::MODE_DIR);

        size_t hashStart = nullPos + 1;
        if (hashStart + Constants::SHA1_RAW_LENGTH > content.size()) {
            throw std::runtime_error("Invalid tree entry: incomplete hash in " + hash);
        }
        const auto* raw = reinterpret_cast<const uint8_t*>(content.data() + hashStart);
        entry.hashHex = IHasher::toHex(std::vector<uint8_t>(raw, raw + Constants::SHA1_RAW_LENGTH));

        entries.push_back(std::move(entry));
        pos = hashStart + Constants::SHA1_RAW_LENGTH;
    }

    return entries;
}

}
