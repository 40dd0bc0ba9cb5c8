#include "core/PatchDiffer.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include "core/Constants.hpp"
#include "core/LineDiff.hpp"
#include "core/ObjectStore.hpp"
#include "core/TreeBuilder.hpp"
#include "util/IHasher.hpp"

namespace gitcl {

namespace {

bool looksBinary(const std::string& content) {
    // Same heuristic as git: a NUL in the first 8000 bytes
    return content.find('\0', 0) < std::min<size_t>(content.size(), 8000);
}

FlatTree treeOf(const ObjectStore& store, const std::string& commit) {
    if (commit.empty()) return FlatTree{};
    return TreeBuilder::flatten(store.readCommit(commit).treeHash, store);
}

void diffBlobs(const ObjectStore& store, FilePatch& fp) {
    // Submodule entries name commits, not blobs
    if (fp.oldMode == Constants::MODE_GITLINK || fp.newMode == Constants::MODE_GITLINK) {
        fp.binary = true;
        return;
    }
    std::string oldText = fp.oldHash.empty() ? std::string() : store.readBlob(fp.oldHash);
    std::string newText = fp.newHash.empty() ? std::string() : store.readBlob(fp.newHash);
    if (looksBinary(oldText) || looksBinary(newText)) {
        fp.binary = true;
        return;
    }
    std::vector<std::string> a = LineDiff::splitLines(oldText);
    std::vector<std::string> b = LineDiff::splitLines(newText);
    // One line of old-side context on each side anchors a region without its line number
    for (const auto& r : LineDiff::diff(a, b)) {
        fp.lines.push_back(r.aStart == 0 ? std::string("^") : " " + a[r.aStart - 1]);
        for (size_t i = r.aStart; i < r.aEnd; ++i) fp.lines.push_back("-" + a[i]);
        for (size_t i = r.bStart; i < r.bEnd; ++i) fp.lines.push_back("+" + b[i]);
        fp.lines.push_back(r.aEnd == a.size() ? std::string("$") : " " + a[r.aEnd]);
    }
}

}

std::string Patch::id() const {
    auto hasher = HasherFactory::createDefault();
    for (const auto& fp : files) {
        std::ostringstream header;
        header << "diff " << fp.path << "\n" << std::oct << "mode " << fp.oldMode << " " << fp.newMode << "\n";
        hasher->update(header.str());
        if (fp.binary) {
            hasher->update("binary " + fp.oldHash + " " + fp.newHash + "\n");
            continue;
        }
        for (const auto& line : fp.lines) {
            hasher->update(line);
            hasher->update("\n");
        }
    }
    return hasher->hexDigest();
}

Expected<Patch> TreePatchDiffer::diff(const std::string& commit, const std::string& parent) {
    try {
        FlatTree newTree = treeOf(store, commit);
        FlatTree oldTree = treeOf(store, parent);

        std::set<std::string> paths;
        for (const auto& kv : oldTree) paths.insert(kv.first);
        for (const auto& kv : newTree) paths.insert(kv.first);

        Patch patch;
        for (const auto& path : paths) {
            auto o = oldTree.find(path);
            auto n = newTree.find(path);
            FilePatch fp;
            fp.path = path;
            if (o != oldTree.end()) {
                fp.oldMode = o->second.mode;
                fp.oldHash = o->second.hashHex;
            }
            if (n != newTree.end()) {
                fp.newMode = n->second.mode;
                fp.newHash = n->second.hashHex;
            }
            if (fp.oldMode == fp.newMode && fp.oldHash == fp.newHash) {
                continue;
            }
            if (fp.oldHash != fp.newHash) {
                diffBlobs(store, fp);
            }
            patch.files.push_back(std::move(fp));
        }
        return patch;
    } catch (const ObjectNotFoundError& e) {
        return Error{ErrorCode::ObjectNotFound, e.what()};
    } catch (const std::runtime_error& e) {
        return Error{ErrorCode::CorruptObject, e.what()};
    }
}

}
