#include <gtest/gtest.h>
#include "core/RebaseSession.hpp"

using namespace gitcl;

class RebaseSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Three stacked changes: 0 <- 1 <- 2
        std::vector<LocalCommit> local;
        std::string parent(40, '0');
        for (char c : {'1', '2', '3'}) {
            LocalCommit commit;
            commit.hash = std::string(40, c);
            commit.parents = {parent};
            commit.changeId = "I" + std::string(40, c);
            local.push_back(commit);
            parent = commit.hash;
        }
        auto built = ChangeIndex::build(local, {});
        ASSERT_TRUE(built.has_value());
        index = built.value();
        chain = index.chains().front();
    }

    ChangeIndex index;
    DependencyChain chain;
};

TEST_F(RebaseSessionTest, StartsUnprocessed) {
    RebaseSession session(index, chain);
    for (size_t m : chain.members) {
        EXPECT_EQ(session.state(m), RebaseState::Unprocessed);
    }
    EXPECT_FALSE(session.finished());
}

TEST_F(RebaseSessionTest, HappyPath) {
    RebaseSession session(index, chain);
    ASSERT_TRUE(session.transition(0, RebaseState::Skipped).has_value());
    ASSERT_TRUE(session.transition(1, RebaseState::Rebasing).has_value());
    ASSERT_TRUE(session.transition(1, RebaseState::Rebased).has_value());
    ASSERT_TRUE(session.transition(2, RebaseState::Rebasing).has_value());
    ASSERT_TRUE(session.transition(2, RebaseState::Rebased).has_value());
    EXPECT_TRUE(session.finished());
}

TEST_F(RebaseSessionTest, DependentCannotStartBeforeDependency) {
    RebaseSession session(index, chain);
    auto result = session.transition(1, RebaseState::Rebasing);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidTransition);

    ASSERT_TRUE(session.transition(0, RebaseState::Rebasing).has_value());
    // Still in progress
    EXPECT_FALSE(session.transition(1, RebaseState::Skipped).has_value());
}

TEST_F(RebaseSessionTest, ConflictBlocksDependents) {
    RebaseSession session(index, chain);
    ASSERT_TRUE(session.transition(0, RebaseState::Rebasing).has_value());
    ASSERT_TRUE(session.transition(0, RebaseState::Conflicted).has_value());

    EXPECT_FALSE(session.transition(1, RebaseState::Rebasing).has_value());
    ASSERT_TRUE(session.transition(1, RebaseState::Blocked).has_value());
    ASSERT_TRUE(session.transition(2, RebaseState::Blocked).has_value());
    EXPECT_TRUE(session.finished());
}

TEST_F(RebaseSessionTest, TerminalStatesAreFinal) {
    RebaseSession session(index, chain);
    ASSERT_TRUE(session.transition(0, RebaseState::Skipped).has_value());
    EXPECT_FALSE(session.transition(0, RebaseState::Rebasing).has_value());
    EXPECT_FALSE(session.transition(0, RebaseState::Unprocessed).has_value());
    EXPECT_EQ(session.state(0), RebaseState::Skipped);
}

TEST_F(RebaseSessionTest, RejectsSkippingRebasing) {
    RebaseSession session(index, chain);
    EXPECT_FALSE(session.transition(0, RebaseState::Rebased).has_value());
    EXPECT_FALSE(session.transition(0, RebaseState::Failed).has_value());
}

TEST_F(RebaseSessionTest, UnknownMemberIsRejected) {
    DependencyChain partial;
    partial.members = {1, 2};
    RebaseSession session(index, partial);

    EXPECT_FALSE(session.transition(0, RebaseState::Rebasing).has_value());
    // Member 1's dependency lies outside the chain and counts as done
    EXPECT_TRUE(session.transition(1, RebaseState::Rebasing).has_value());
}

TEST(RebaseStateTest, NamesAndTerminality) {
    EXPECT_STREQ(rebaseStateName(RebaseState::Conflicted), "CONFLICTED");
    EXPECT_STREQ(rebaseStateName(RebaseState::Blocked), "BLOCKED");
    EXPECT_FALSE(isTerminal(RebaseState::Unprocessed));
    EXPECT_FALSE(isTerminal(RebaseState::Rebasing));
    EXPECT_TRUE(isTerminal(RebaseState::Failed));
    EXPECT_TRUE(isTerminal(RebaseState::Skipped));
}
