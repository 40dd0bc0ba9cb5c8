#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "test_utils.hpp"
#include "core/Constants.hpp"
#include "core/ObjectStore.hpp"
#include "core/CommitObject.hpp"
#include "core/TreeBuilder.hpp"
#include "util/IHasher.hpp"

namespace fs = std::filesystem;

using namespace gitcl;
using namespace gitcl::test::utils;

class ObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        initTestRepo(tempDir);
        gitDir = tempDir / ".git";
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    CommitObject sampleCommit(const std::string& tree) {
        CommitObject c;
        c.treeHash = tree;
        c.authorName = c.committerName = "Test User";
        c.authorEmail = c.committerEmail = "test@example.com";
        c.authorTimestamp = c.committerTimestamp = 1698765432;
        c.message = "Test message\n\nChange-Id: I0123456789abcdef0123456789abcdef01234567\n";
        return c;
    }

    fs::path tempDir;
    fs::path gitDir;
};

// Blob ids match git's
TEST_F(ObjectStoreTest, BlobIdsMatchGit) {
    ObjectStore store(gitDir);

    EXPECT_EQ(store.writeBlob("hello world"), "95d09f2b10159347eece71399a7e2e907ea3df4f");
    EXPECT_EQ(store.writeBlob(""), "e69de29bb2d1d6434b8b29ae775ad8c2e48c5391");
}

TEST_F(ObjectStoreTest, EmptyTreeIdMatchesGit) {
    ObjectStore store(gitDir);

    EXPECT_EQ(TreeBuilder::build(FlatTree{}, store), "4b825dc642cb6eb9a060e54bf8d69288fbee4904");
}

// Test: Object stored in 2-char directory
TEST_F(ObjectStoreTest, ObjectStoredInTwoCharDirectory) {
    ObjectStore store(gitDir);

    std::string hash = store.writeBlob("test");

    fs::path objPath = store.getObjectPath(hash);
    EXPECT_TRUE(fs::exists(objPath));
    EXPECT_EQ(objPath.parent_path().filename().string(), hash.substr(0, 2));
    EXPECT_EQ(objPath.filename().string().length(), 38);
    EXPECT_EQ(objPath.parent_path().parent_path(), gitDir / "objects");
}

TEST_F(ObjectStoreTest, HashFileContentMatchesWrittenBlob) {
    ObjectStore store(gitDir);

    fs::path filePath = createFile(tempDir, "test.txt", "content");
    std::string hash = store.hashFileContent(filePath);

    EXPECT_FALSE(store.hasObject(hash));
    EXPECT_EQ(hash, store.writeBlobFromFile(filePath));
    EXPECT_TRUE(store.hasObject(hash));
}

TEST_F(ObjectStoreTest, WriteObjectTwiceKeepsOneFile) {
    ObjectStore store(gitDir);

    std::string hash1 = store.writeBlob("content");
    auto size1 = fs::file_size(store.getObjectPath(hash1));
    std::string hash2 = store.writeBlob("content");

    EXPECT_EQ(hash1, hash2);
    EXPECT_EQ(size1, fs::file_size(store.getObjectPath(hash2)));
    EXPECT_FALSE(fs::exists(fs::path(store.getObjectPath(hash1).string() + ".tmp")));
}

TEST_F(ObjectStoreTest, CommitRoundTripKeepsMessageVerbatim) {
    ObjectStore store(gitDir);
    std::string tree = TreeBuilder::build(FlatTree{}, store);

    CommitObject first = sampleCommit(tree);
    std::string hash1 = store.writeCommit(first);

    CommitObject second = sampleCommit(tree);
    second.parentHashes.push_back(hash1);
    second.authorTimezone = "+0130";
    std::string hash2 = store.writeCommit(second);

    CommitObject read = store.readCommit(hash2);
    EXPECT_EQ(read.hash, hash2);
    EXPECT_EQ(read.treeHash, tree);
    ASSERT_EQ(read.parentHashes.size(), 1u);
    EXPECT_EQ(read.parentHashes[0], hash1);
    EXPECT_EQ(read.authorName, "Test User");
    EXPECT_EQ(read.authorEmail, "test@example.com");
    EXPECT_EQ(read.authorTimestamp, 1698765432);
    EXPECT_EQ(read.authorTimezone, "+0130");
    EXPECT_EQ(read.message, second.message);
    // Re-serialising gives back the same id
    EXPECT_EQ(store.hashObject(ObjectType::Commit, read.serialize()), hash2);
}

TEST_F(ObjectStoreTest, SignedCommitKeepsSignatureHeader) {
    ObjectStore store(gitDir);
    std::string tree = TreeBuilder::build(FlatTree{}, store);

    std::string raw = "tree " + tree + "\n"
                      "author A <a@example.com> 1 +0000\n"
                      "committer A <a@example.com> 1 +0000\n"
                      "gpgsig -----BEGIN PGP SIGNATURE-----\n"
                      " abcdef\n"
                      " -----END PGP SIGNATURE-----\n"
                      "\n"
                      "Signed\n";
    std::string hash = store.writeObject(ObjectType::Commit, raw);

    CommitObject read = store.readCommit(hash);
    ASSERT_EQ(read.extraHeaders.size(), 1u);
    EXPECT_EQ(read.extraHeaders[0].rfind("gpgsig ", 0), 0u);
    EXPECT_EQ(read.serialize(), raw);
}

TEST_F(ObjectStoreTest, ReadTreeEntries) {
    ObjectStore store(gitDir);
    FlatTree files;
    files["README.md"] = FileEntry{Constants::MODE_FILE, store.writeBlob("readme")};
    files["bin/run.sh"] = FileEntry{Constants::MODE_EXECUTABLE, store.writeBlob("#!/bin/sh\n")};
    std::string tree = TreeBuilder::build(files, store);

    auto entries = store.readTree(tree);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "README.md");
    EXPECT_EQ(entries[0].mode, Constants::MODE_FILE);
    EXPECT_FALSE(entries[0].isTree);
    EXPECT_EQ(entries[1].name, "bin");
    EXPECT_TRUE(entries[1].isTree);

    auto sub = store.readTree(entries[1].hashHex);
    ASSERT_EQ(sub.size(), 1u);
    EXPECT_EQ(sub[0].mode, Constants::MODE_EXECUTABLE);
}

TEST_F(ObjectStoreTest, MissingObjectThrowsNotFound) {
    ObjectStore store(gitDir);

    EXPECT_THROW(store.readCommit("1111111111111111111111111111111111111111"), ObjectNotFoundError);
    EXPECT_THROW(store.readCommit("nonexistent"), ObjectNotFoundError);
    EXPECT_FALSE(store.hasObject("1111111111111111111111111111111111111111"));
}

TEST_F(ObjectStoreTest, WrongTypeIsRejected) {
    ObjectStore store(gitDir);
    std::string blob = store.writeBlob("not a commit");

    EXPECT_THROW(store.readCommit(blob), std::runtime_error);
    EXPECT_THROW(store.readTree(blob), std::runtime_error);
    EXPECT_EQ(store.readBlob(blob), "not a commit");
}

TEST_F(ObjectStoreTest, CorruptObjectFileThrows) {
    ObjectStore store(gitDir);
    std::string hash = store.writeBlob("soon corrupt");

    fs::path objPath = store.getObjectPath(hash);
    fs::permissions(objPath, fs::perms::owner_write, fs::perm_options::add);
    std::ofstream(objPath, std::ios::binary | std::ios::trunc) << "garbage";

    EXPECT_THROW(store.readBlob(hash), std::runtime_error);
}
