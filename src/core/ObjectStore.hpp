#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/CommitObject.hpp"

namespace gitcl {

class IHasher;
class PackReader;

/// Object kinds, numbered as in packfile entry headers
enum class ObjectType { Commit = 1, Tree = 2, Blob = 3, Tag = 4 };

const char* objectTypeName(ObjectType type);

/// Thrown by the read side when an id has no loose object
class ObjectNotFoundError : public std::runtime_error {
public:
    explicit ObjectNotFoundError(const std::string& hash)
        : std::runtime_error("object not found: " + hash), hash_(hash) {}
    const std::string& hash() const { return hash_; }

private:
    std::string hash_;
};

/// Decompressed object without its "<type> <size>\0" header
struct RawObject {
    ObjectType type{ObjectType::Blob};
    std::string payload;
};

/**
 * @brief Tree entry representing a file or subdirectory in a tree object
 *
 * Git tree format:
 *   <octal-mode> <name>\0<20-byte-sha1>
 * Example:
 *   100644 file.txt\0<binary-hash>
 *   40000 subdir\0<binary-hash>
 */
struct TreeEntry {
    uint32_t mode{0};       // 040000 (dir), 100644 (file), 100755 (executable), 120000 (symlink)
    std::string name;
    std::string hashHex;
    bool isTree{false};
};

/**
 * @brief Git loose object storage
 *
 * Manages <gitdir>/objects where blobs, trees and commits are stored in
 * content-addressable format, identified by their SHA-1.
 *
 * Git Object Format:
 *   Objects are stored as: "<type> <size>\0<content>"
 *   For blobs: "blob 12\0file content"
 *
 * Storage Layout (Git standard):
 *   objects/<first-2-chars>/<remaining-38-chars>, zlib-deflated.
 *
 * Objects are always written loose. Reads fall back to packfiles
 * (objects/pack), so clones and gc'ed repositories work. Errors are reported
 * by throwing: ObjectNotFoundError for missing ids, std::runtime_error for
 * I/O failures and malformed objects.
 */
class ObjectStore {
public:
    /**
     * @param gitDir Path to the repository's .git directory
     * @param hasher Hash algorithm to use (defaults to SHA-1 if nullptr)
     */
    explicit ObjectStore(const std::filesystem::path& gitDir, std::unique_ptr<IHasher> hasher = nullptr);
    ~ObjectStore();

    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;
    ObjectStore(ObjectStore&&) noexcept;
    ObjectStore& operator=(ObjectStore&&) noexcept;

    /// Returns path to <gitdir>/objects
    std::filesystem::path objectsDir() const;

    /// Path for object: objects/<aa>/<bbbb...>
    std::filesystem::path getObjectPath(const std::string& hash) const;

    bool hasObject(const std::string& hash) const;

    /// Object id of a payload without storing it
    std::string hashObject(ObjectType type, const std::string& payload);

    /// Store a payload (no-op when the object already exists); returns its id
    std::string writeObject(ObjectType type, const std::string& payload);

    std::string writeBlob(const std::string& bytes);
    std::string writeBlobFromFile(const std::filesystem::path& filePath);

    /// @param content Serialized tree entries (see TreeBuilder)
    std::string writeTree(const std::string& content);

    std::string writeCommit(const CommitObject& commit);

    /**
     * @brief Compute git blob id for a file without storing it
     *
     * Symlinks hash their target path, as git does.
     */
    std::string hashFileContent(const std::filesystem::path& filePath);

    RawObject readObject(const std::string& hash) const;
    std::string readBlob(const std::string& hash) const;
    CommitObject readCommit(const std::string& hash) const;
    std::vector<TreeEntry> readTree(const std::string& hash) const;

private:
    std::filesystem::path gitDir;
    std::unique_ptr<IHasher> hasher;
    mutable std::unique_ptr<PackReader> packs;  // Indexed on first miss

    const PackReader& packReader() const;
};

/// Git tree order: names compare as if directories had a trailing '/'
bool treeEntryLess(const TreeEntry& a, const TreeEntry& b);

}
