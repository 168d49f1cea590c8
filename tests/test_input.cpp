#include <gtest/gtest.h>
#include <sstream>
#include "input.h"

TEST(ReadReferralsTest, Basic) {
    auto in = std::istringstream("alice bob\nbob\tcharlie\n  charlie   david  \n");
    auto res = readReferrals(in);
    ASSERT_EQ(res.size(), 3u);
    EXPECT_EQ(res[0], ReferralPair("alice", "bob"));
    EXPECT_EQ(res[1], ReferralPair("bob", "charlie"));
    EXPECT_EQ(res[2], ReferralPair("charlie", "david"));
}

TEST(ReadReferralsTest, CommentsAndBlankLines) {
    auto in = std::istringstream("# referrer candidate\n\nalice bob\n   # indented comment\n   \nbob carol");
    auto res = readReferrals(in);
    ASSERT_EQ(res.size(), 2u);
    EXPECT_EQ(res[1], ReferralPair("bob", "carol"));
}

TEST(ReadReferralsTest, MalformedLine) {
    auto single = std::istringstream("alice bob\nbob\n");
    try {
        (void)readReferrals(single);
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("Line 2"), std::string::npos) << e.what();
    }

    auto triple = std::istringstream("alice bob carol\n");
    EXPECT_THROW((void)readReferrals(triple), std::invalid_argument);
}

TEST(ReadReferralsTest, MissingFile) {
    EXPECT_THROW((void)readReferrals(fs::path("/nonexistent/referrals.txt")), std::invalid_argument);
}

TEST(LoadReferralsTest, CountsRejections) {
    auto in = std::istringstream(
            "alice bob\n"
            "bob charlie\n"
            "carol bob\n"       // Duplicate referrer
            "charlie alice\n"   // Cycle
            "dave dave\n"       // Self-referral
            "alice eve\n");
    auto graph = ReferralGraph{};
    auto summary = loadReferrals(graph, readReferrals(in));
    EXPECT_EQ(summary.accepted, 3u);
    EXPECT_EQ(summary.rejected, 3u);
    EXPECT_EQ(graph.nReferrals(), 3u);
    EXPECT_EQ(graph.totalReach("alice"), 3u);
    EXPECT_FALSE(graph.contains("carol"));
    EXPECT_FALSE(graph.contains("dave"));
}
