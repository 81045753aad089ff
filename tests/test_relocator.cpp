/**
 * @file test_relocator.cpp
 * @brief Unit tests for relocations (GoogleTest)
 */

#include <gtest/gtest.h>
#include "reconfy/Relocator.hpp"
#include "reconfy/Errors.hpp"

using namespace reconfy;

class RelocatorTest : public ::testing::Test {
protected:
    Pattern pattern{Pattern::Part(1, 100), Pattern::Part("."), Pattern::Part(0, 10)};

    Version v(const std::string& id) const { return Version::parse(pattern, id); }

    Node user = node_from_value({
        {"a", "1.2"},
        {"z", {{"a", 1}, {"b", 15}}},
        {"o", "a: b"}
    });
};

// ============================================================================
// Ordering and range
// ============================================================================

TEST_F(RelocatorTest, AppliesEarlierVersionsFirst) {
    RelocationRules rules = {
        {"2.3", {{Route{"o"}, Route{"m"}}, {Route{"z"}, Route{"s"}}}},
        {"1.3", {{Route{"z", "a"}, Route{"r"}}}},
    };

    auto steps = relocate(user, v("1.2"), v("2.3"), rules);

    ASSERT_EQ(steps.size(), 3u);
    EXPECT_EQ(steps[0].version_id, "1.3");
    EXPECT_EQ(steps[1].version_id, "2.3");
    EXPECT_EQ(steps[2].version_id, "2.3");

    EXPECT_EQ(user.find(Route{"r"})->as_value(), 1);
    EXPECT_EQ(user.find(Route{"m"})->as_value(), "a: b");
    ASSERT_TRUE(user.find(Route{"s"})->is_section());
    EXPECT_EQ(user.find(Route{"s"})->as_section().size(), 1u);
    EXPECT_EQ(user.find(Route{"s", "b"})->as_value(), 15);
    EXPECT_FALSE(user.contains(Route{"z"}));
    EXPECT_FALSE(user.contains(Route{"o"}));
}

TEST_F(RelocatorTest, NumericOrderNotTextOrder) {
    // "10.0" sorts before "9.0" as text
    RelocationRules rules = {
        {"10.0", {{Route{"b"}, Route{"c"}}}},
        {"9.0", {{Route{"o"}, Route{"b"}}}},
    };

    relocate(user, v("1.2"), v("10.0"), rules);

    EXPECT_EQ(user.find(Route{"c"})->as_value(), "a: b");
    EXPECT_FALSE(user.contains(Route{"b"}));
}

TEST_F(RelocatorTest, LowerBoundExclusiveUpperBoundInclusive) {
    RelocationRules rules = {
        {"1.2", {{Route{"o"}, Route{"too_early"}}}},
        {"2.3", {{Route{"z"}, Route{"s"}}}},
        {"2.4", {{Route{"a"}, Route{"too_late"}}}},
    };

    auto steps = relocate(user, v("1.2"), v("2.3"), rules);

    ASSERT_EQ(steps.size(), 1u);
    EXPECT_TRUE(user.contains(Route{"o"}));
    EXPECT_TRUE(user.contains(Route{"s"}));
    EXPECT_TRUE(user.contains(Route{"a"}));
}

// ============================================================================
// Individual moves
// ============================================================================

TEST_F(RelocatorTest, MissingSourceIsSkipped) {
    RelocationRules rules = {{"2.0", {{Route{"nothing", "here"}, Route{"x"}}}}};
    const Node before = user;

    auto steps = relocate(user, v("1.2"), v("2.3"), rules);

    EXPECT_TRUE(steps.empty());
    EXPECT_EQ(user, before);
}

TEST_F(RelocatorTest, ChainedMovesWithinOneVersion) {
    RelocationRules rules = {{"2.0", {
        {Route{"o"}, Route{"tmp"}},
        {Route{"tmp"}, Route{"deep", "er", "o"}},
    }}};

    relocate(user, v("1.2"), v("2.3"), rules);

    EXPECT_FALSE(user.contains(Route{"tmp"}));
    EXPECT_EQ(user.find(Route{"deep", "er", "o"})->as_value(), "a: b");
}

TEST_F(RelocatorTest, TargetIsOverwritten) {
    RelocationRules rules = {{"2.0", {{Route{"o"}, Route{"a"}}}}};

    relocate(user, v("1.2"), v("2.3"), rules);

    EXPECT_EQ(user.find(Route{"a"})->as_value(), "a: b");
}

TEST_F(RelocatorTest, MovedNodeKeepsComments) {
    user.find(Route{"z"})->comments().push_back("legacy block");
    RelocationRules rules = {{"2.0", {{Route{"z"}, Route{"s"}}}}};

    relocate(user, v("1.2"), v("2.3"), rules);

    const Node* s = user.find(Route{"s"});
    ASSERT_NE(s, nullptr);
    ASSERT_EQ(s->comments().size(), 1u);
    EXPECT_EQ(s->comments()[0], "legacy block");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(RelocatorTest, MalformedRuleVersionThrows) {
    // Out of range for the pattern, even though it is outside the window
    RelocationRules rules = {{"0.5", {{Route{"o"}, Route{"m"}}}}};
    EXPECT_THROW(relocate(user, v("1.2"), v("2.3"), rules), VersionParseError);
}

TEST_F(RelocatorTest, EmptyRouteThrows) {
    RelocationRules rules = {{"2.0", {{Route(), Route{"m"}}}}};
    EXPECT_THROW(relocate(user, v("1.2"), v("2.3"), rules), SettingsError);
}
