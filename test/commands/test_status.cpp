#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include "test_utils.hpp"
#include "fakes/FakeRemote.hpp"
#include "cli/commands/StatusCommand.hpp"
#include "core/GitDirRepository.hpp"

namespace fs = std::filesystem;

using namespace gitcl;
using namespace gitcl::test;
using namespace gitcl::test::utils;

class StatusCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        initTestRepo(tempDir);

        remote = std::make_shared<FakeRemote>();
        ctx.workDir = tempDir;
        ctx.remoteFactory = [this](const AppContext&) -> Expected<std::shared_ptr<RemoteChangeClient>> {
            return std::shared_ptr<RemoteChangeClient>(remote);
        };

        base = writeCommit(tempDir, {{"a.txt", "1\n2\n3\n"}}, "", "base\n", 1700000000);
        setRef(tempDir, "refs/remotes/origin/master", base);

        // Capture output
        oldCout = std::cout.rdbuf();
        std::cout.rdbuf(outputStream.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(oldCout);
        removeDir(tempDir);
    }

    std::string getOutput() { return outputStream.str(); }

    fs::path tempDir;
    AppContext ctx;
    std::shared_ptr<FakeRemote> remote;
    StatusCommand cmd;
    std::string base;
    std::stringstream outputStream;
    std::streambuf* oldCout{nullptr};
};

TEST_F(StatusCommandTest, NothingAhead) {
    setRef(tempDir, "refs/heads/master", base);

    auto result = cmd.execute(ctx, {});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(getOutput(), "On branch master, 0 commit(s) ahead of origin/master\n");
}

TEST_F(StatusCommandTest, ClassifiesEachCommit) {
    std::string c1 = writeCommit(tempDir, {{"a.txt", "one\n2\n3\n"}}, base, changeMessage("first", changeIdFor(1)), 1700000001);
    std::string c2 = writeCommit(tempDir, {{"a.txt", "one\n2\nthree\n"}}, c1, changeMessage("second", changeIdFor(2)), 1700000002);
    std::string c3 = writeCommit(tempDir, {{"a.txt", "one\n2\nthree\nfour\n"}}, c2, "wip\n", 1700000003);
    setRef(tempDir, "refs/heads/master", c3);
    remote->addChange(changeIdFor(1), {{c1, base}});

    auto result = cmd.execute(ctx, {});
    ASSERT_TRUE(result.has_value()) << result.error().message;

    std::string out = getOutput();
    EXPECT_EQ(out.rfind("On branch master, 3 commit(s) ahead of origin/master\n", 0), 0u);
    EXPECT_NE(out.find("  " + c1.substr(0, 9) + "  up-to-date   " + changeIdFor(1) + "  first\n"), std::string::npos);
    EXPECT_NE(out.find("  " + c2.substr(0, 9) + "  new          " + changeIdFor(2) + "  second\n"), std::string::npos);
    EXPECT_NE(out.find("  " + c3.substr(0, 9) + "  not-uploaded -  wip\n"), std::string::npos);
    EXPECT_NE(out.find("Dependency chains:\n  " + changeIdFor(1) + " -> " + changeIdFor(2) + "\n"), std::string::npos);
}

TEST_F(StatusCommandTest, DetachedHeadAndCustomOnto) {
    std::string c1 = writeCommit(tempDir, {{"a.txt", "one\n2\n3\n"}}, base, changeMessage("first", changeIdFor(1)), 1700000001);
    createFile(tempDir / ".git", "HEAD", c1 + "\n");
    setRef(tempDir, "refs/heads/stable", base);

    auto result = cmd.execute(ctx, {"--onto", "stable"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(getOutput().rfind("HEAD detached at " + c1.substr(0, 9) + ", 1 commit(s) ahead of stable\n", 0), 0u);
}

TEST_F(StatusCommandTest, UnknownOntoIsRefNotFound) {
    setRef(tempDir, "refs/heads/master", base);
    auto result = cmd.execute(ctx, {"--onto", "origin/none"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RefNotFound);
}

TEST_F(StatusCommandTest, OutsideRepositoryFails) {
    fs::path outside = createTempDir();
    ctx.workDir = outside;
    auto result = cmd.execute(ctx, {});
    removeDir(outside);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotARepository);
}

TEST_F(StatusCommandTest, RejectsUnknownArguments) {
    EXPECT_EQ(cmd.execute(ctx, {"--verbose"}).error().code, ErrorCode::InvalidArgs);
}
