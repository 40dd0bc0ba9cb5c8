#include "test_utils.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

#include "core/Constants.hpp"
#include "core/GitDirRepository.hpp"
#include "core/ObjectStore.hpp"
#include "core/Repository.hpp"
#include "core/TreeBuilder.hpp"
#include "util/IHasher.hpp"

namespace fs = std::filesystem;

namespace gitcl::test::utils {

fs::path createTempDir() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string dirname = "gitcl_test_";
    for (int i = 0; i < 8; ++i) {
        dirname += "0123456789abcdef"[dis(gen)];
    }

    fs::path tempDir = fs::temp_directory_path() / dirname;
    fs::create_directories(tempDir);
    return tempDir;
}

void removeDir(const fs::path& dir) {
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        fs::remove_all(dir, ec);
    }
}

fs::path createFile(const fs::path& baseDir, const std::string& filename, const std::string& content) {
    fs::path filePath = baseDir / filename;

    // Create parent directories if needed
    fs::create_directories(filePath.parent_path());

    std::ofstream file(filePath, std::ios::binary);
    file << content;
    file.close();

    return filePath;
}

std::string readFile(const fs::path& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool fileHasContent(const fs::path& filePath, const std::string& expectedContent) {
    if (!fs::exists(filePath)) {
        return false;
    }
    return readFile(filePath) == expectedContent;
}

fs::path initTestRepo(const fs::path& repoPath) {
    fs::path gitDir = repoPath / ".git";
    fs::create_directories(gitDir / "objects");
    fs::create_directories(gitDir / "refs" / "heads");
    fs::create_directories(gitDir / "refs" / "tags");

    std::ofstream headFile(gitDir / "HEAD");
    headFile << "ref: refs/heads/master\n";
    headFile.close();

    std::ofstream config(gitDir / "config");
    config << "[core]\n\trepositoryformatversion = 0\n\tbare = false\n"
           << "[user]\n\tname = Test User\n\temail = test@example.com\n";
    config.close();

    return repoPath;
}

std::string writeCommit(const fs::path& root, const Files& files, const std::string& parent,
                        const std::string& message, int64_t timestamp) {
    ObjectStore store(root / ".git");
    FlatTree flat;
    for (const auto& [path, content] : files) {
        flat[path] = FileEntry{Constants::MODE_FILE, store.writeBlob(content)};
    }

    CommitObject commit;
    commit.treeHash = TreeBuilder::build(flat, store);
    if (!parent.empty()) commit.parentHashes.push_back(parent);
    commit.authorName = commit.committerName = "Test User";
    commit.authorEmail = commit.committerEmail = "test@example.com";
    commit.authorTimestamp = commit.committerTimestamp = timestamp;
    commit.message = message;
    return store.writeCommit(commit);
}

std::string changeMessage(const std::string& subject, const std::string& changeId) {
    return subject + "\n\nChange-Id: " + changeId + "\n";
}

std::string changeIdFor(int n) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "I%040x", static_cast<unsigned>(n));
    return buf;
}

void setRef(const fs::path& root, const std::string& refName, const std::string& commit) {
    auto res = Repository::writeRef(root / ".git", refName, commit);
    if (!res) throw std::runtime_error(res.error().message);
}

std::string readRef(const fs::path& root, const std::string& refName) {
    auto res = Repository::readRef(root / ".git", refName);
    return res ? res.value() : std::string();
}

void checkoutBranch(const fs::path& root, const std::string& branch) {
    GitDirRepository repo(root, root / ".git", Identity{"Test User", "test@example.com"});
    auto res = repo.checkout(branch);
    if (!res) throw std::runtime_error(res.error().message);
}

std::string headFile(const fs::path& root) {
    std::string text = readFile(root / ".git" / "HEAD");
    while (!text.empty() && text.back() == '\n') text.pop_back();
    return text;
}

fs::path getCwd() {
    return fs::current_path();
}

void setCwd(const fs::path& dir) {
    fs::current_path(dir);
}

} // namespace gitcl::test::utils
