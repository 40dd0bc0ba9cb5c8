#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace gitcl {

class ObjectStore;

/// Changes to one path between two trees
struct FilePatch {
    std::string path;
    uint32_t oldMode{0};        // 0 when added
    uint32_t newMode{0};        // 0 when deleted
    std::string oldHash;
    std::string newHash;
    bool binary{false};
    // Per changed region: " context" (or "^" at start of file), "-line"..., "+line"...,
    // " context" (or "$" at end of file)
    std::vector<std::string> lines;
};

/**
 * @brief Content of a commit relative to a parent, independent of position
 *
 * Two patches with equal id() describe the same change even when applied on
 * different bases: hunk line numbers are not part of the id. Changed lines
 * are compared verbatim, whitespace included, and each region is anchored by
 * the unchanged line on either side.
 */
struct Patch {
    std::vector<FilePatch> files;    // Sorted by path

    bool empty() const { return files.empty(); }

    /// Stable SHA-1 over the normalized file changes
    std::string id() const;
};

/**
 * @brief Capability computing a commit's patch against a parent
 *
 * Reconciliation only compares patches; swapping this implementation changes
 * what counts as "the same change" without touching classification.
 */
class IPatchDiffer {
public:
    virtual ~IPatchDiffer() = default;

    /**
     * @param commit Commit id
     * @param parent Commit id to diff against (empty: the empty tree)
     * @return Patch, or ObjectNotFound when either commit is not available locally
     */
    virtual Expected<Patch> diff(const std::string& commit, const std::string& parent) = 0;
};

/// Tree-to-tree line diff over the local object store
class TreePatchDiffer : public IPatchDiffer {
public:
    explicit TreePatchDiffer(const ObjectStore& store) : store(store) {}

    Expected<Patch> diff(const std::string& commit, const std::string& parent) override;

private:
    const ObjectStore& store;
};

}
