#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include "util/Expected.hpp"

namespace gitcl {

/**
 * @brief Staging area entry for a single file
 *
 * Mirrors git's index entry: stat data used for fast dirty detection plus
 * the blob id and mode recorded for the path.
 */
struct IndexEntry {
    std::string path;        // Path relative to repo root (e.g., "src/main.cpp")
    std::string hashHex;     // Blob id
    uint32_t mode{0};        // 0100644, 0100755, 0120000
    uint64_t sizeBytes{0};
    uint64_t mtimeNs{0};
    uint64_t ctimeNs{0};
    uint32_t dev{0};
    uint32_t ino{0};
    uint32_t uid{0};
    uint32_t gid{0};
    uint16_t stage{0};       // Non-zero only for unmerged entries
};

/**
 * @brief git index (.git/index) reader and writer
 *
 * On-disk format (DIRC):
 *   "DIRC" <version:4> <count:4>
 *   per entry: ctime, mtime (sec+nsec), dev, ino, mode, uid, gid, size (4 bytes each),
 *              <sha1:20> <flags:2> [<extended flags:2>, v3] <path> NUL padding to 8 bytes
 *   extensions (skipped on load, not written)
 *   <sha1 of everything above:20>
 *
 * Versions 2 and 3 are read; version 2 is written. Version 4 (prefix
 * compressed paths) is rejected.
 */
class Index {
public:
    /// Load <gitDir>/index; a missing file is an empty index
    Expected<void> load(const std::filesystem::path& gitDir);

    /// Write <gitDir>/index atomically (via index.lock)
    Expected<void> save(const std::filesystem::path& gitDir) const;

    void addOrUpdate(const IndexEntry& entry);
    void remove(const std::string& path);
    void clear();

    const std::map<std::string, IndexEntry>& entries() const { return pathToEntry; }

    /// Parse an index image
    static Expected<Index> parse(const std::string& bytes);

    /// Serialize as version 2
    std::string serialize() const;

private:
    std::map<std::string, IndexEntry> pathToEntry;  // Sorted, as the format requires
};

}
