#pragma once

#include <filesystem>
#include <memory>
#include <set>

#include "core/LocalRepository.hpp"
#include "core/ObjectStore.hpp"
#include "core/PatchDiffer.hpp"
#include "core/TreeBuilder.hpp"
#include "util/Config.hpp"

namespace gitcl {

/**
 * @brief LocalRepository over a git working tree and its .git directory
 *
 * Reads and writes loose objects through ObjectStore, refs through
 * Repository, and the index in DIRC format.
 */
class GitDirRepository : public LocalRepository {
public:
    GitDirRepository(const std::filesystem::path& root, const std::filesystem::path& gitDir, Identity committer);

    /// Discover the repository containing `start`; identity from git config
    static Expected<std::unique_ptr<GitDirRepository>> open(const std::filesystem::path& start);

    Expected<std::vector<LocalCommit>> listCommits(const std::string& range) override;
    Expected<LocalCommit> readCommit(const std::string& hash) override;
    Expected<LocalCommit> createCommit(const std::string& tree, const std::string& parent,
                                       const std::string& message) override;
    Expected<LocalCommit> cherryPick(const std::string& commit, const std::string& ontoParent) override;
    Expected<void> checkout(const std::string& ref) override;
    Expected<std::string> resolve(const std::string& ref) override;
    Expected<HeadState> head() override;
    Expected<void> updateBranch(const std::string& branch, const std::string& commit) override;
    Expected<bool> isWorktreeClean() override;
    Expected<std::vector<PackObject>> collectPushObjects(const std::string& commit,
                                                         const std::string& parent) override;
    IPatchDiffer& patchDiffer() override { return differ; }

    const std::filesystem::path& root() const { return rootPath; }
    const std::filesystem::path& gitDir() const { return gitPath; }
    ObjectStore& objects() { return store; }
    const Identity& committer() const { return identity; }

private:
    std::filesystem::path rootPath;
    std::filesystem::path gitPath;
    Identity identity;
    ObjectStore store;
    TreePatchDiffer differ;

    /// Peel tags and verify the object is a commit
    std::string peelToCommit(const std::string& hash) const;
    FlatTree commitFiles(const std::string& commit) const;
    std::set<std::string> ancestorsOf(const std::string& commit) const;
    void writeWorktreeFile(const std::string& path, const FileEntry& entry) const;
    void removeWorktreeFile(const std::string& path) const;
    LocalCommit toLocalCommit(const CommitObject& commit) const;
    void collectTreeIds(const std::string& tree, std::set<std::string>& out) const;
};

}
