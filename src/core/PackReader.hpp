#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/ObjectStore.hpp"

namespace gitcl {

/**
 * @brief Read-only access to objects/pack/*.pack through their .idx files
 *
 * Index files (version 2) are loaded on construction; a pack file is read
 * into memory the first time one of its objects is requested. Both delta
 * kinds (OFS_DELTA, REF_DELTA) are resolved; REF_DELTA bases may live in
 * another pack or as loose objects, through `fallback`.
 */
class PackReader {
public:
    explicit PackReader(const std::filesystem::path& objectsDir);

    bool contains(const std::string& hash) const;

    /// Throws ObjectNotFoundError when absent, std::runtime_error when corrupt
    RawObject read(const std::string& hash, const ObjectStore& fallback) const;

    size_t packCount() const { return packs.size(); }

private:
    struct Pack {
        std::filesystem::path packPath;
        mutable std::optional<std::string> data;   // Whole pack, loaded on demand
    };
    struct Location {
        size_t pack{0};
        uint64_t offset{0};
    };

    std::vector<Pack> packs;
    std::map<std::string, Location> locations;

    void loadIndex(const std::filesystem::path& idxPath, size_t packNo);
    const std::string& packData(size_t packNo) const;
    RawObject readAt(size_t packNo, uint64_t offset, const ObjectStore& fallback, int depth) const;
};

/// Apply a git delta to `base`; throws std::runtime_error on malformed input
std::string applyDelta(const std::string& base, const std::string& delta);

}
