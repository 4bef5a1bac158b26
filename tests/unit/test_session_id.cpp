#include <gtest/gtest.h>

#include "terminal/session_id.hpp"

using namespace termpanel::terminal;

TEST(SessionId, PrefixIsAddedOnce)
{
    auto a = SessionId::canonical("term-", "build");
    auto b = SessionId::canonical("term-", "term-build");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->str(), "term-build");
    EXPECT_EQ(*a, *b);
}

TEST(SessionId, RejectsEmptyAndBarePrefix)
{
    EXPECT_FALSE(SessionId::canonical("term-", "").has_value());
    EXPECT_FALSE(SessionId::canonical("term-", "term-").has_value());
}

TEST(SessionId, RejectsCharactersTmuxRewrites)
{
    EXPECT_FALSE(SessionId::canonical("term-", "a.b").has_value());
    EXPECT_FALSE(SessionId::canonical("term-", "a:b").has_value());
    EXPECT_FALSE(SessionId::canonical("term-", "a b").has_value());
    EXPECT_FALSE(SessionId::canonical("term-", "../x").has_value());
    EXPECT_TRUE(SessionId::canonical("term-", "Build_2-x").has_value());
}

TEST(SessionId, RejectsOverlongNames)
{
    std::string name(MAX_SESSION_NAME_LEN, 'a');
    EXPECT_FALSE(SessionId::canonical("term-", name).has_value());
    EXPECT_TRUE(SessionId::canonical("term-", name.substr(0, MAX_SESSION_NAME_LEN - 5)));
}

TEST(SessionId, FromCanonicalRequiresPrefix)
{
    EXPECT_TRUE(SessionId::from_canonical("term-", "term-a").has_value());
    EXPECT_FALSE(SessionId::from_canonical("term-", "other").has_value());
    EXPECT_FALSE(SessionId::from_canonical("term-", "term-").has_value());
}

TEST(SessionId, HashMatchesEquality)
{
    auto a = SessionId::canonical("term-", "x");
    auto b = SessionId::canonical("term-", "term-x");
    EXPECT_EQ(SessionIdHash{}(*a), SessionIdHash{}(*b));
}
