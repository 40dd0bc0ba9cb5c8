#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include "fakes/FakeRemote.hpp"
#include "cli/commands/ReviewCommand.hpp"

using namespace gitcl;
using namespace gitcl::test;

class ReviewCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        remote = std::make_shared<FakeRemote>();
        ctx.remoteFactory = [this](const AppContext&) -> Expected<std::shared_ptr<RemoteChangeClient>> {
            return std::shared_ptr<RemoteChangeClient>(remote);
        };
        remote->addChange(idA, {{std::string(40, '1'), std::string(40, '0')},
                                {std::string(40, '2'), std::string(40, '0')}}, "Add widget");
        remote->addChange(idB, {{std::string(40, '3'), std::string(40, '2')}}, "Use widget");

        oldCout = std::cout.rdbuf();
        std::cout.rdbuf(outputStream.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(oldCout);
    }

    std::string getOutput() { return outputStream.str(); }

    const std::string idA = "I" + std::string(40, 'a');
    const std::string idB = "I" + std::string(40, 'b');
    AppContext ctx;
    std::shared_ptr<FakeRemote> remote;
    ReviewCommand cmd;
    std::stringstream outputStream;
    std::streambuf* oldCout{nullptr};
};

TEST_F(ReviewCommandTest, ShowsChangeDetail) {
    auto result = cmd.execute(ctx, {idA});
    ASSERT_TRUE(result.has_value()) << result.error().message;

    std::string out = getOutput();
    EXPECT_NE(out.find("change-id " + idA + " (1000)"), std::string::npos);
    EXPECT_NE(out.find("Project: demo (master)"), std::string::npos);
    EXPECT_NE(out.find("Status:  NEW"), std::string::npos);
    EXPECT_NE(out.find("Patch sets:"), std::string::npos);
    EXPECT_NE(out.find("    2  222222222  parent 000000000"), std::string::npos);
}

TEST_F(ReviewCommandTest, AcceptsLegacyNumbersAndRanges) {
    auto result = cmd.execute(ctx, {"1000..1001"});
    ASSERT_TRUE(result.has_value());
    std::string out = getOutput();
    EXPECT_NE(out.find("Subject: Add widget"), std::string::npos);
    EXPECT_NE(out.find("Subject: Use widget"), std::string::npos);
}

TEST_F(ReviewCommandTest, SkipsUnknownChanges) {
    auto result = cmd.execute(ctx, {"4242", idB});
    ASSERT_TRUE(result.has_value());
    EXPECT_NE(getOutput().find("Subject: Use widget"), std::string::npos);
    EXPECT_EQ(getOutput().find("4242"), std::string::npos);
}

TEST_F(ReviewCommandTest, NothingFoundIsNotFound) {
    auto result = cmd.execute(ctx, {"4242"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);

    auto invalid = cmd.execute(ctx, {"not-a-change"});
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code, ErrorCode::NotFound);
}

TEST_F(ReviewCommandTest, PrintsPatchOfLatestRevision) {
    remote->patches[idA] = "From 2222\nSubject: [PATCH] Add widget\n";
    auto result = cmd.execute(ctx, {"--patch", idA});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_NE(getOutput().find("Subject: [PATCH] Add widget"), std::string::npos);
}

TEST_F(ReviewCommandTest, RequiresArgument) {
    EXPECT_EQ(cmd.execute(ctx, {}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(cmd.execute(ctx, {"--bogus", idA}).error().code, ErrorCode::InvalidArgs);
}

TEST_F(ReviewCommandTest, NetworkErrorStopsImmediately) {
    remote->failAll = Error{ErrorCode::NetworkError, "timeout"};
    auto result = cmd.execute(ctx, {idA, idB});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NetworkError);
    EXPECT_EQ(remote->getChangeCalls, 1);
}
