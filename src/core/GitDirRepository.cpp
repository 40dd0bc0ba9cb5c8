#include "core/GitDirRepository.hpp"

#include <algorithm>
#include <ctime>
#include <deque>
#include <fstream>

#include "core/ChangeId.hpp"
#include "core/Constants.hpp"
#include "core/Index.hpp"
#include "core/LineDiff.hpp"
#include "util/FileMetadata.hpp"
#include "util/IHasher.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitcl {

namespace {

/// Run `fn`, turning object store exceptions into Errors
template <typename Fn>
auto guarded(const std::string& what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const ObjectNotFoundError& e) {
        return Error{ErrorCode::ObjectNotFound, what + ": " + e.what()};
    } catch (const fs::filesystem_error& e) {
        return Error{ErrorCode::IoError, what + ": " + e.what()};
    } catch (const std::runtime_error& e) {
        return Error{ErrorCode::CorruptObject, what + ": " + e.what()};
    }
}

bool isBinary(const std::string& content) {
    return content.find('\0') != std::string::npos;
}

bool isRegularMode(uint32_t mode) {
    return mode == Constants::MODE_FILE || mode == Constants::MODE_EXECUTABLE;
}

/// Merge one path changed differently on both sides; returns false on conflict
bool mergeEntry(ObjectStore& store, const FileEntry& base, const FileEntry& ours, const FileEntry& theirs,
                FileEntry& merged) {
    // Mode: a one-sided mode change wins, two different ones conflict
    if (ours.mode == base.mode) {
        merged.mode = theirs.mode;
    } else if (theirs.mode == base.mode || theirs.mode == ours.mode) {
        merged.mode = ours.mode;
    } else {
        return false;
    }

    if (ours.hashHex == theirs.hashHex || theirs.hashHex == base.hashHex) {
        merged.hashHex = ours.hashHex;
        return true;
    }
    if (ours.hashHex == base.hashHex) {
        merged.hashHex = theirs.hashHex;
        return true;
    }
    if (!isRegularMode(base.mode) || !isRegularMode(ours.mode) || !isRegularMode(theirs.mode)) {
        return false;
    }

    std::string baseText = store.readBlob(base.hashHex);
    std::string ourText = store.readBlob(ours.hashHex);
    std::string theirText = store.readBlob(theirs.hashHex);
    if (isBinary(baseText) || isBinary(ourText) || isBinary(theirText)) {
        return false;
    }
    LineDiff::MergeResult result = LineDiff::merge3(baseText, ourText, theirText);
    if (!result.clean) {
        return false;
    }
    merged.hashHex = store.writeBlob(result.text);
    return true;
}

std::set<std::string> readShallowBoundary(const fs::path& gitDir) {
    std::set<std::string> out;
    std::ifstream in(gitDir / "shallow");
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out.insert(line);
    }
    return out;
}

}

GitDirRepository::GitDirRepository(const fs::path& root, const fs::path& gitDir, Identity committer)
    : rootPath(root), gitPath(gitDir), identity(std::move(committer)), store(gitDir), differ(store) {}

Expected<std::unique_ptr<GitDirRepository>> GitDirRepository::open(const fs::path& start) {
    auto root = Repository::discoverRoot(start);
    if (!root) return root.error();
    auto gitDir = Repository::gitDirOf(root.value());
    if (!gitDir) return gitDir.error();
    Identity who = Config::loadIdentity(gitDir.value(), Config::homeDirectory());
    Logger::instance().debug("repository " + root.value().string() + " (git dir " + gitDir.value().string() + ")");
    return std::make_unique<GitDirRepository>(root.value(), gitDir.value(), who);
}

std::string GitDirRepository::peelToCommit(const std::string& hash) const {
    std::string cur = hash;
    for (int depth = 0; depth < 10; ++depth) {
        RawObject obj = store.readObject(cur);
        if (obj.type == ObjectType::Commit) {
            return cur;
        }
        if (obj.type != ObjectType::Tag || obj.payload.rfind("object ", 0) != 0) {
            throw std::runtime_error(cur + " is a " + objectTypeName(obj.type) + ", not a commit");
        }
        cur = obj.payload.substr(7, Constants::SHA1_HEX_LENGTH);
    }
    throw std::runtime_error("tag chain too deep at " + hash);
}

FlatTree GitDirRepository::commitFiles(const std::string& commit) const {
    if (commit.empty()) return FlatTree{};
    return TreeBuilder::flatten(store.readCommit(commit).treeHash, store);
}

std::set<std::string> GitDirRepository::ancestorsOf(const std::string& commit) const {
    std::set<std::string> shallow = readShallowBoundary(gitPath);
    std::set<std::string> seen;
    std::deque<std::string> queue{commit};
    while (!queue.empty()) {
        std::string cur = queue.front();
        queue.pop_front();
        if (!seen.insert(cur).second) continue;
        // Parents of shallow commits are not present by definition
        if (shallow.count(cur)) continue;
        for (const auto& parent : store.readCommit(cur).parentHashes) {
            if (!seen.count(parent)) queue.push_back(parent);
        }
    }
    return seen;
}

LocalCommit GitDirRepository::toLocalCommit(const CommitObject& commit) const {
    LocalCommit lc;
    lc.hash = commit.hash;
    lc.parents = commit.parentHashes;
    lc.changeId = ChangeId::fromCommitMessage(commit.message);
    lc.author = commit.authorIdent();
    lc.subject = commit.shortMessage();
    return lc;
}

Expected<std::string> GitDirRepository::resolve(const std::string& ref) {
    auto hash = Repository::resolve(gitPath, ref);
    if (!hash) return hash;
    return guarded("resolve " + ref, [&]() -> Expected<std::string> {
        return peelToCommit(hash.value());
    });
}

Expected<HeadState> GitDirRepository::head() {
    return Repository::readHEAD(gitPath);
}

Expected<LocalCommit> GitDirRepository::readCommit(const std::string& hash) {
    return guarded("read commit " + hash, [&]() -> Expected<LocalCommit> {
        return toLocalCommit(store.readCommit(hash));
    });
}

Expected<std::vector<LocalCommit>> GitDirRepository::listCommits(const std::string& range) {
    std::string baseSpec;
    std::string tipSpec = range;
    size_t dots = range.find("..");
    if (dots != std::string::npos) {
        baseSpec = range.substr(0, dots);
        tipSpec = range.substr(dots + 2);
    }
    if (tipSpec.empty()) tipSpec = "HEAD";

    auto tip = resolve(tipSpec);
    if (!tip) return tip.error();
    std::string base;
    if (!baseSpec.empty()) {
        auto b = resolve(baseSpec);
        if (!b) return b.error();
        base = b.value();
    }

    return guarded("list " + range, [&]() -> Expected<std::vector<LocalCommit>> {
        std::set<std::string> excluded;
        if (!base.empty()) excluded = ancestorsOf(base);

        std::vector<LocalCommit> out;
        std::string cur = tip.value();
        while (!cur.empty() && !excluded.count(cur)) {
            CommitObject c = store.readCommit(cur);
            if (c.parentHashes.size() > 1) {
                return Error{ErrorCode::InvalidArgs,
                             "merge commit " + c.shortHash() + " in " + range + "; a change stack must be linear"};
            }
            out.push_back(toLocalCommit(c));
            cur = c.firstParent();
        }
        std::reverse(out.begin(), out.end());
        Logger::instance().debug(range + ": " + std::to_string(out.size()) + " commit(s)");
        return out;
    });
}

Expected<LocalCommit> GitDirRepository::createCommit(const std::string& tree, const std::string& parent,
                                                     const std::string& message) {
    return guarded("create commit", [&]() -> Expected<LocalCommit> {
        CommitObject c;
        c.treeHash = tree;
        if (!parent.empty()) c.parentHashes.push_back(parent);
        c.authorName = c.committerName = identity.name;
        c.authorEmail = c.committerEmail = identity.email;
        c.authorTimestamp = c.committerTimestamp = static_cast<int64_t>(std::time(nullptr));
        c.message = message;
        if (!c.message.empty() && c.message.back() != '\n') c.message += '\n';
        c.hash = store.writeCommit(c);
        return toLocalCommit(c);
    });
}

Expected<LocalCommit> GitDirRepository::cherryPick(const std::string& commit, const std::string& ontoParent) {
    return guarded("cherry-pick " + commit, [&]() -> Expected<LocalCommit> {
        CommitObject picked = store.readCommit(commit);
        if (picked.parentHashes.size() > 1) {
            return Error{ErrorCode::InvalidArgs, "cannot cherry-pick merge commit " + picked.shortHash()};
        }
        if (picked.firstParent() == ontoParent) {
            return toLocalCommit(picked);
        }

        FlatTree base = commitFiles(picked.firstParent());
        FlatTree theirs = TreeBuilder::flatten(picked.treeHash, store);
        FlatTree ours = commitFiles(ontoParent);

        std::set<std::string> paths;
        for (const auto& kv : base) paths.insert(kv.first);
        for (const auto& kv : theirs) paths.insert(kv.first);
        for (const auto& kv : ours) paths.insert(kv.first);

        auto lookup = [](const FlatTree& t, const std::string& p) -> const FileEntry* {
            auto it = t.find(p);
            return it == t.end() ? nullptr : &it->second;
        };
        auto same = [](const FileEntry* a, const FileEntry* b) {
            if (!a || !b) return a == b;
            return *a == *b;
        };

        FlatTree result;
        std::vector<std::string> conflicts;
        for (const auto& path : paths) {
            const FileEntry* b = lookup(base, path);
            const FileEntry* o = lookup(ours, path);
            const FileEntry* t = lookup(theirs, path);

            if (same(o, t) || same(b, t)) {
                if (o) result[path] = *o;
            } else if (same(b, o)) {
                if (t) result[path] = *t;
            } else if (b && o && t) {
                FileEntry merged;
                if (mergeEntry(store, *b, *o, *t, merged)) {
                    result[path] = merged;
                } else {
                    conflicts.push_back(path);
                }
            } else {
                // add/add with different content, or delete/modify
                conflicts.push_back(path);
            }
        }

        // A path cannot be both a file and a directory
        for (const auto& kv : result) {
            const std::string& path = kv.first;
            for (size_t slash = path.find('/'); slash != std::string::npos; slash = path.find('/', slash + 1)) {
                if (result.count(path.substr(0, slash))) {
                    conflicts.push_back(path.substr(0, slash));
                }
            }
        }

        if (!conflicts.empty()) {
            std::sort(conflicts.begin(), conflicts.end());
            conflicts.erase(std::unique(conflicts.begin(), conflicts.end()), conflicts.end());
            Error err{ErrorCode::Conflict, "could not apply " + picked.shortHash() + " " + picked.shortMessage()};
            err.paths = conflicts;
            return err;
        }

        CommitObject rewritten = picked;
        rewritten.treeHash = TreeBuilder::build(result, store);
        rewritten.parentHashes = {ontoParent};
        rewritten.committerName = identity.name;
        rewritten.committerEmail = identity.email;
        rewritten.committerTimestamp = static_cast<int64_t>(std::time(nullptr));
        rewritten.committerTimezone = "+0000";
        // Signatures do not survive a rewrite
        rewritten.extraHeaders.erase(
            std::remove_if(rewritten.extraHeaders.begin(), rewritten.extraHeaders.end(),
                           [](const std::string& h) { return h.rfind("gpgsig", 0) == 0; }),
            rewritten.extraHeaders.end());
        rewritten.hash = store.writeCommit(rewritten);

        if (result == ours) {
            Logger::instance().warn(picked.shortHash() + " is empty on top of " + ontoParent.substr(0, 7));
        }
        Logger::instance().debug("cherry-picked " + picked.shortHash() + " onto " + ontoParent.substr(0, 7) +
                                 " as " + rewritten.shortHash());
        return toLocalCommit(rewritten);
    });
}

void GitDirRepository::writeWorktreeFile(const std::string& path, const FileEntry& entry) const {
    fs::path target = rootPath / path;
    std::error_code ec;

    // A file standing where a directory is needed (or the reverse) goes first
    for (fs::path dir = target.parent_path(); dir != rootPath && dir.has_relative_path(); dir = dir.parent_path()) {
        if (fs::exists(fs::symlink_status(dir, ec)) && !fs::is_directory(fs::symlink_status(dir, ec))) {
            fs::remove(dir);
        }
    }
    fs::create_directories(target.parent_path());
    if (fs::is_directory(fs::symlink_status(target, ec)) && entry.mode != Constants::MODE_GITLINK) {
        fs::remove_all(target);
    } else if (fs::exists(fs::symlink_status(target, ec))) {
        fs::remove(target);
    }

    if (entry.mode == Constants::MODE_GITLINK) {
        fs::create_directories(target);
        return;
    }
    std::string content = store.readBlob(entry.hashHex);
    if (entry.mode == Constants::MODE_SYMLINK) {
        fs::create_symlink(content, target);
        return;
    }

    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot write " + target.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            throw std::runtime_error("cannot write " + target.string());
        }
    }
    const fs::perms exec = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    fs::permissions(target, exec,
                    entry.mode == Constants::MODE_EXECUTABLE ? fs::perm_options::add : fs::perm_options::remove);
}

void GitDirRepository::removeWorktreeFile(const std::string& path) const {
    fs::path target = rootPath / path;
    std::error_code ec;
    if (fs::is_directory(fs::symlink_status(target, ec))) {
        // Submodule checkouts are left alone unless empty
        fs::remove(target, ec);
    } else {
        fs::remove(target);
    }
    for (fs::path dir = target.parent_path(); dir != rootPath && dir.has_relative_path(); dir = dir.parent_path()) {
        if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec)) break;
        fs::remove(dir, ec);
    }
}

Expected<void> GitDirRepository::checkout(const std::string& ref) {
    std::string branchRef;
    if (ref.rfind("refs/heads/", 0) == 0) {
        branchRef = ref;
    } else if (!Repository::isObjectId(ref) && Repository::readRef(gitPath, "refs/heads/" + ref)) {
        branchRef = "refs/heads/" + ref;
    }

    auto target = resolve(branchRef.empty() ? ref : branchRef);
    if (!target) return target.error();
    auto current = head();
    if (!current) return current.error();

    return guarded("checkout " + ref, [&]() -> Expected<void> {
        FlatTree newFiles = commitFiles(target.value());
        FlatTree oldFiles = commitFiles(current.value().commit);

        for (const auto& [path, entry] : oldFiles) {
            if (!newFiles.count(path)) {
                removeWorktreeFile(path);
            }
        }
        std::error_code ec;
        for (const auto& [path, entry] : newFiles) {
            auto old = oldFiles.find(path);
            bool present = fs::exists(fs::symlink_status(rootPath / path, ec));
            if (old == oldFiles.end() || old->second != entry || !present) {
                writeWorktreeFile(path, entry);
            }
        }

        Index index;
        for (const auto& [path, entry] : newFiles) {
            IndexEntry ie;
            ie.path = path;
            ie.hashHex = entry.hashHex;
            ie.mode = entry.mode;
            if (entry.mode != Constants::MODE_GITLINK) {
                FileMetadata meta = getFileMetadata(rootPath / path);
                ie.sizeBytes = meta.sizeBytes;
                ie.mtimeNs = meta.mtimeNs;
                ie.ctimeNs = meta.ctimeNs;
                ie.dev = meta.dev;
                ie.ino = meta.ino;
                ie.uid = meta.uid;
                ie.gid = meta.gid;
            }
            index.addOrUpdate(ie);
        }
        auto saved = index.save(gitPath);
        if (!saved) return saved.error();

        auto moved = branchRef.empty() ? Repository::detachHEAD(gitPath, target.value())
                                       : Repository::attachHEAD(gitPath, branchRef);
        if (!moved) return moved.error();
        Logger::instance().debug("checked out " + ref + " at " + target.value().substr(0, 7));
        return {};
    });
}

Expected<void> GitDirRepository::updateBranch(const std::string& branch, const std::string& commit) {
    std::string refName = branch.rfind("refs/", 0) == 0 ? branch : "refs/heads/" + branch;
    return Repository::writeRef(gitPath, refName, commit);
}

Expected<bool> GitDirRepository::isWorktreeClean() {
    auto current = head();
    if (!current) return current.error();

    return guarded("status", [&]() -> Expected<bool> {
        FlatTree tracked = commitFiles(current.value().commit);

        Index index;
        bool haveIndex = fs::exists(gitPath / "index");
        if (haveIndex) {
            auto loaded = index.load(gitPath);
            if (!loaded) return loaded.error();

            // Staged changes: index differs from HEAD
            if (index.entries().size() != tracked.size()) {
                Logger::instance().debug("index and HEAD track different paths");
                return false;
            }
            for (const auto& [path, ie] : index.entries()) {
                auto it = tracked.find(path);
                if (ie.stage != 0 || it == tracked.end() || it->second.hashHex != ie.hashHex ||
                    it->second.mode != ie.mode) {
                    Logger::instance().debug("staged change: " + path);
                    return false;
                }
            }
        }

        for (const auto& [path, entry] : tracked) {
            if (entry.mode == Constants::MODE_GITLINK) continue;
            fs::path file = rootPath / path;
            std::error_code ec;
            if (!fs::exists(fs::symlink_status(file, ec))) {
                Logger::instance().debug("deleted: " + path);
                return false;
            }
            bool isLink = fs::is_symlink(fs::symlink_status(file, ec));
            if (isLink != (entry.mode == Constants::MODE_SYMLINK)) {
                Logger::instance().debug("type changed: " + path);
                return false;
            }
            if (!isLink) {
                FileMetadata meta = getFileMetadata(file);
                if (meta.mode != entry.mode) {
                    Logger::instance().debug("mode changed: " + path);
                    return false;
                }
                // Unchanged stat data means the index hash still holds
                auto ie = index.entries().find(path);
                if (haveIndex && ie != index.entries().end() && ie->second.sizeBytes == meta.sizeBytes &&
                    ie->second.mtimeNs == meta.mtimeNs && ie->second.mtimeNs != 0) {
                    continue;
                }
            }
            if (store.hashFileContent(file) != entry.hashHex) {
                Logger::instance().debug("modified: " + path);
                return false;
            }
        }
        return true;
    });
}

void GitDirRepository::collectTreeIds(const std::string& tree, std::set<std::string>& out) const {
    if (!out.insert(tree).second) return;
    for (const auto& entry : store.readTree(tree)) {
        if (entry.isTree) {
            collectTreeIds(entry.hashHex, out);
        } else if (entry.mode != Constants::MODE_GITLINK) {
            out.insert(entry.hashHex);
        }
    }
}

Expected<std::vector<PackObject>> GitDirRepository::collectPushObjects(const std::string& commit,
                                                                       const std::string& parent) {
    return guarded("collect objects for " + commit, [&]() -> Expected<std::vector<PackObject>> {
        std::set<std::string> have;
        if (!parent.empty()) {
            collectTreeIds(store.readCommit(parent).treeHash, have);
        }

        std::vector<PackObject> out;
        RawObject raw = store.readObject(commit);
        std::string tree = store.readCommit(commit).treeHash;
        out.push_back(PackObject{commit, raw.type, raw.payload});

        std::vector<std::string> pending{tree};
        while (!pending.empty()) {
            std::string id = pending.back();
            pending.pop_back();
            if (!have.insert(id).second) continue;
            RawObject treeObj = store.readObject(id);
            out.push_back(PackObject{id, treeObj.type, treeObj.payload});
            for (const auto& entry : store.readTree(id)) {
                if (entry.isTree) {
                    pending.push_back(entry.hashHex);
                } else if (entry.mode != Constants::MODE_GITLINK && have.insert(entry.hashHex).second) {
                    RawObject blob = store.readObject(entry.hashHex);
                    out.push_back(PackObject{entry.hashHex, blob.type, blob.payload});
                }
            }
        }
        Logger::instance().debug("push of " + commit.substr(0, 7) + " carries " + std::to_string(out.size()) +
                                 " object(s)");
        return out;
    });
}

}
