#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/ObjectStore.hpp"

namespace gitcl {

/// One file of a flattened tree
struct FileEntry {
    uint32_t mode{0};
    std::string hashHex;

    bool operator==(const FileEntry& other) const { return mode == other.mode && hashHex == other.hashHex; }
    bool operator!=(const FileEntry& other) const { return !(*this == other); }
};

/// Full slash-separated path -> file, sorted by path
using FlatTree = std::map<std::string, FileEntry>;

/**
 * @brief Converts between nested git tree objects and flat path maps
 *
 * Merging and checkout work on flat maps; commits need nested trees.
 *
 * Example:
 *   Flat entries:
 *     src/main.cpp -> blob abc123
 *     src/util.cpp -> blob def456
 *     README.md    -> blob 789abc
 *
 *   Creates trees:
 *     tree(root):    100644 README.md <blob-hash>, 40000 src <tree-hash>
 *     tree(src):     100644 main.cpp <blob-hash>, 100644 util.cpp <blob-hash>
 */
class TreeBuilder {
public:
    /**
     * @brief Write the nested trees for `files` and return the root tree id
     *
     * An empty map produces git's empty tree.
     */
    static std::string build(const FlatTree& files, ObjectStore& store);

    /// Recursively read `treeHash` into a flat path map
    static FlatTree flatten(const std::string& treeHash, const ObjectStore& store);

    /// Serialize already sorted entries in tree object format
    static std::string serializeEntries(const std::vector<TreeEntry>& entries);

private:
    /**
     * @brief Build tree for a specific directory path
     * @param dirPath Directory path (empty for root)
     */
    static std::string buildTree(const std::string& dirPath, const FlatTree& files, ObjectStore& store);

    /**
     * @brief Collect direct children of a directory
     *
     * For dirPath="src", finds:
     *   - Files: src/main.cpp -> "main.cpp"
     *   - Subdirs: src/util/helper.cpp -> "util" (as tree, built recursively)
     */
    static std::vector<TreeEntry> getDirectChildren(const std::string& dirPath, const FlatTree& files,
                                                    ObjectStore& store);

    static void flattenInto(const std::string& treeHash, const std::string& prefix,
                            const ObjectStore& store, FlatTree& out);
};

}
