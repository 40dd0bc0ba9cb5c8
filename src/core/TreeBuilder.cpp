#include "core/TreeBuilder.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

#include "core/Constants.hpp"
#include "util/IHasher.hpp"

namespace gitcl {

std::string TreeBuilder::build(const FlatTree& files, ObjectStore& store) {
    return buildTree("", files, store);
}

std::string TreeBuilder::serializeEntries(const std::vector<TreeEntry>& entries) {
    std::string content;
    for (const auto& entry : entries) {
        // Mode as octal text without leading zero ("100644", "40000")
        std::ostringstream mode;
        mode << std::oct << entry.mode;
        content += mode.str();
        content += ' ';
        content += entry.name;
        content += '\0';

        std::vector<uint8_t> raw;
        if (!IHasher::fromHex(entry.hashHex, raw) || raw.size() != Constants::SHA1_RAW_LENGTH) {
            throw std::runtime_error("Invalid object id in tree entry " + entry.name + ": " + entry.hashHex);
        }
        content.append(reinterpret_cast<const char*>(raw.data()), raw.size());
    }
    return content;
}

std::string TreeBuilder::buildTree(const std::string& dirPath, const FlatTree& files, ObjectStore& store) {
    std::vector<TreeEntry> children = getDirectChildren(dirPath, files, store);
    std::sort(children.begin(), children.end(), treeEntryLess);
    return store.writeTree(serializeEntries(children));
}

std::vector<TreeEntry> TreeBuilder::getDirectChildren(const std::string& dirPath, const FlatTree& files,
                                                      ObjectStore& store) {
    std::vector<TreeEntry> children;
    std::set<std::string> seenSubdirs;

    std::string prefix = dirPath.empty() ? "" : dirPath + "/";

    // The map is sorted, so this directory's paths form one contiguous run
    for (auto it = files.lower_bound(prefix); it != files.end(); ++it) {
        const std::string& path = it->first;
        if (path.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        std::string relPath = path.substr(prefix.length());
        size_t slashPos = relPath.find('/');

        if (slashPos == std::string::npos) {
            TreeEntry te;
            te.mode = it->second.mode;
            te.name = relPath;
            te.hashHex = it->second.hashHex;
            te.isTree = false;
            children.push_back(te);
            continue;
        }

        std::string subdirName = relPath.substr(0, slashPos);
        if (!seenSubdirs.insert(subdirName).second) {
            continue;
        }
        TreeEntry te;
        te.mode = Constants::MODE_DIR;
        te.name = subdirName;
        te.hashHex = buildTree(prefix + subdirName, files, store);
        te.isTree = true;
        children.push_back(te);
    }

    return children;
}

FlatTree TreeBuilder::flatten(const std::string& treeHash, const ObjectStore& store) {
    FlatTree out;
    flattenInto(treeHash, "", store, out);
    return out;
}

void TreeBuilder::flattenInto(const std::string& treeHash, const std::string& prefix,
                              const ObjectStore& store, FlatTree& out) {
    for (const auto& entry : store.readTree(treeHash)) {
        std::string path = prefix + entry.name;
        if (entry.isTree) {
            flattenInto(entry.hashHex, path + "/", store, out);
        } else {
            out[path] = FileEntry{entry.mode, entry.hashHex};
        }
    }
}

}
