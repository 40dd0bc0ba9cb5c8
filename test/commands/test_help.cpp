#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include "cli/CommandFactory.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/RebaseCommand.hpp"
#include "cli/commands/ReviewCommand.hpp"

using namespace gitcl;

class HelpCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& f = CommandFactory::instance();
        f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
        f.registerCreator("review", [] { return std::make_unique<ReviewCommand>(); });
        f.registerCreator("rebase", [] { return std::make_unique<RebaseCommand>(); });
        f.registerAlias("show", "review");

        oldCout = std::cout.rdbuf();
        std::cout.rdbuf(outputStream.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(oldCout);
    }

    std::string getOutput() { return outputStream.str(); }

    AppContext ctx;
    HelpCommand cmd;
    std::stringstream outputStream;
    std::streambuf* oldCout{nullptr};
};

TEST_F(HelpCommandTest, ListsRegisteredCommands) {
    auto result = cmd.execute(ctx, {});
    ASSERT_TRUE(result.has_value());

    std::string out = getOutput();
    EXPECT_EQ(out.rfind("usage: git-cl", 0), 0u);
    EXPECT_NE(out.find("  rebase\t"), std::string::npos);
    EXPECT_NE(out.find("  review\t"), std::string::npos);
    EXPECT_LT(out.find("  rebase\t"), out.find("  review\t"));
    EXPECT_EQ(out.find("  show\t"), std::string::npos);
}

TEST_F(HelpCommandTest, DetailForCommandAndAlias) {
    ASSERT_TRUE(cmd.execute(ctx, {"rebase"}).has_value());
    std::string out = getOutput();
    EXPECT_NE(out.find("NAME\n    rebase"), std::string::npos);
    EXPECT_NE(out.find("SYNOPSIS\n"), std::string::npos);
    EXPECT_NE(out.find("--onto"), std::string::npos);

    outputStream.str("");
    ASSERT_TRUE(cmd.execute(ctx, {"show"}).has_value());
    EXPECT_NE(getOutput().find("NAME\n    review"), std::string::npos);
}

TEST_F(HelpCommandTest, UnknownTopic) {
    auto result = cmd.execute(ctx, {"frobnicate"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs);
}
