#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include "fakes/FakeRemote.hpp"
#include "cli/commands/ListCommand.hpp"

using namespace gitcl;
using namespace gitcl::test;

class ListCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        remote = std::make_shared<FakeRemote>();
        ctx.remoteFactory = [this](const AppContext&) -> Expected<std::shared_ptr<RemoteChangeClient>> {
            return std::shared_ptr<RemoteChangeClient>(remote);
        };

        // Capture output
        oldCout = std::cout.rdbuf();
        std::cout.rdbuf(outputStream.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(oldCout);
    }

    std::string getOutput() { return outputStream.str(); }

    AppContext ctx;
    std::shared_ptr<FakeRemote> remote;
    ListCommand cmd;
    std::stringstream outputStream;
    std::streambuf* oldCout{nullptr};
};

TEST_F(ListCommandTest, PrintsOpenChanges) {
    remote->addChange("I" + std::string(40, 'a'), {{std::string(40, '1'), std::string(40, '0')}}, "Add widget");
    remote->addChange("I" + std::string(40, 'b'), {}, "Fix widget", "stable");

    auto result = cmd.execute(ctx, {});
    ASSERT_TRUE(result.has_value()) << result.error().message;

    std::string expected =
        "change-id I" + std::string(40, 'a') + " (1000)\n"
        "Owner:   Test User <test@example.com>\n"
        "Subject: Add widget\n"
        "\n"
        "change-id I" + std::string(40, 'b') + " (1001)\n"
        "Owner:   Test User <test@example.com>\n"
        "Subject: Fix widget\n";
    EXPECT_EQ(getOutput(), expected);

    ASSERT_EQ(remote->queries.size(), 1u);
    EXPECT_EQ(remote->queries[0].status, "open");
    EXPECT_EQ(remote->queries[0].owner, "self");
    EXPECT_FALSE(remote->queries[0].watched);
}

TEST_F(ListCommandTest, EmptyResultPrintsNothing) {
    auto result = cmd.execute(ctx, {"--status", "merged"});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(getOutput().empty());
}

TEST_F(ListCommandTest, PassesFilters) {
    auto result = cmd.execute(ctx, {"--status", "abandoned", "--owner", "jdoe", "--branch", "stable"});
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(remote->queries.size(), 1u);
    EXPECT_EQ(remote->queries[0].status, "abandoned");
    EXPECT_EQ(remote->queries[0].owner, "jdoe");
    EXPECT_EQ(remote->queries[0].branch, "stable");
}

TEST_F(ListCommandTest, WatchedQuery) {
    ASSERT_TRUE(cmd.execute(ctx, {"--watched"}).has_value());
    EXPECT_TRUE(remote->queries[0].watched);
}

TEST_F(ListCommandTest, RejectsBadArguments) {
    EXPECT_EQ(cmd.execute(ctx, {"--status", "pending"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(cmd.execute(ctx, {"--owner"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(cmd.execute(ctx, {"--owner", "me", "--watched"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(cmd.execute(ctx, {"--frobnicate"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_TRUE(remote->queries.empty());
}

TEST_F(ListCommandTest, RemoteErrorIsReturned) {
    remote->failAll = Error{ErrorCode::AuthFailure, "authentication failed (HTTP 401)"};
    auto result = cmd.execute(ctx, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::AuthFailure);
}

TEST_F(ListCommandTest, MissingHostIsConfigError) {
    AppContext bare;
    auto result = cmd.execute(bare, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}
