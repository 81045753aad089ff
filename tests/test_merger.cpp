/**
 * @file test_merger.cpp
 * @brief Unit tests for the structural merge (GoogleTest)
 */

#include <gtest/gtest.h>
#include "reconfy/Merger.hpp"
#include "reconfy/Errors.hpp"

using namespace reconfy;

// ============================================================================
// Default rules
// ============================================================================

TEST(Merge, AddsMissingKeysAndKeepsUserValues) {
    Node user = node_from_value({{"y", true}, {"port", 8080}});
    Node defaults = node_from_value({{"y", false}, {"port", 80}, {"t", 100}});

    MergeReport report = merge(user, defaults, UpdaterSettings{});

    EXPECT_EQ(user.find(Route{"y"})->as_value(), true);
    EXPECT_EQ(user.find(Route{"port"})->as_value(), 8080);
    EXPECT_EQ(user.find(Route{"t"})->as_value(), 100);
    ASSERT_EQ(report.added.size(), 1u);
    EXPECT_EQ(report.added[0], Route{"t"});
    EXPECT_TRUE(report.replaced.empty());
}

TEST(Merge, RecursesIntoSections) {
    Node user = node_from_value({{"db", {{"host", "prod"}}}});
    Node defaults = node_from_value({{"db", {{"host", "localhost"}, {"port", 5432}}}});

    MergeReport report = merge(user, defaults, UpdaterSettings{});

    EXPECT_EQ(user.find(Route{"db", "host"})->as_value(), "prod");
    EXPECT_EQ(user.find(Route{"db", "port"})->as_value(), 5432);
    ASSERT_EQ(report.added.size(), 1u);
    EXPECT_EQ(report.added[0], (Route{"db", "port"}));
}

TEST(Merge, UnusedUserKeysRemovedByDefault) {
    Node user = node_from_value({{"keep", 1}, {"p", 50}, {"nested", {{"old", 1}, {"keep", 2}}}});
    Node defaults = node_from_value({{"keep", 0}, {"nested", {{"keep", 0}}}});

    MergeReport report = merge(user, defaults, UpdaterSettings{});

    EXPECT_FALSE(user.contains(Route{"p"}));
    EXPECT_FALSE(user.contains(Route{"nested", "old"}));
    EXPECT_EQ(report.removed.size(), 2u);
}

TEST(Merge, KeepAllRetainsUnusedKeys) {
    Node user = node_from_value({{"keep", 1}, {"p", 50}});
    Node defaults = node_from_value({{"keep", 0}});
    UpdaterSettings settings;
    settings.keep_all = true;

    MergeReport report = merge(user, defaults, settings);

    EXPECT_EQ(user.find(Route{"p"})->as_value(), 50);
    EXPECT_TRUE(report.removed.empty());
}

TEST(Merge, MismatchedKindsAdoptDefaults) {
    Node user = node_from_value({{"a", 1}, {"b", {{"x", 1}}}});
    Node defaults = node_from_value({{"a", {{"x", 2}}}, {"b", "flat"}});

    MergeReport report = merge(user, defaults, UpdaterSettings{});

    ASSERT_TRUE(user.find(Route{"a"})->is_section());
    EXPECT_EQ(user.find(Route{"a", "x"})->as_value(), 2);
    EXPECT_EQ(user.find(Route{"b"})->as_value(), "flat");
    EXPECT_EQ(report.replaced.size(), 2u);
}

TEST(Merge, CopiesDefaultsCommentsWithNewKeys) {
    Node user;
    Node defaults = node_from_value({{"t", 100}});
    defaults.find(Route{"t"})->comments().push_back("timeout in seconds");

    merge(user, defaults, UpdaterSettings{});

    ASSERT_EQ(user.find(Route{"t"})->comments().size(), 1u);
    EXPECT_EQ(user.find(Route{"t"})->comments()[0], "timeout in seconds");
}

TEST(Merge, DefaultsTreeUntouched) {
    Node user = node_from_value({{"a", 1}, {"extra", true}});
    const Node defaults = node_from_value({{"a", 2}, {"s", {{"b", 1}}}});
    const Node before = defaults;

    merge(user, defaults, UpdaterSettings{});

    EXPECT_EQ(defaults, before);
}

TEST(Merge, AppendsNewKeysAfterExistingOnes) {
    Node user = node_from_value({{"b", 1}});
    Node defaults = node_from_value({{"a", 0}, {"b", 0}, {"c", 0}});

    merge(user, defaults, UpdaterSettings{});

    std::vector<std::string> expected{"b", "a", "c"};
    EXPECT_EQ(user.as_section().keys(), expected);
}

// ============================================================================
// Configured rules
// ============================================================================

TEST(MergeRules, AdoptDefaultsForMappings) {
    Node user = node_from_value({{"y", true}});
    Node defaults = node_from_value({{"y", false}});
    UpdaterSettings settings;
    settings.merge_rules[MergeRule::Mappings] = MergeAction::AdoptDefaults;

    MergeReport report = merge(user, defaults, settings);

    EXPECT_EQ(user.find(Route{"y"})->as_value(), false);
    EXPECT_EQ(report.replaced.size(), 1u);
}

TEST(MergeRules, KeepUserForMismatchedKinds) {
    Node user = node_from_value({{"a", 1}, {"b", {{"x", 1}}}});
    Node defaults = node_from_value({{"a", {{"x", 2}}}, {"b", "flat"}});
    UpdaterSettings settings;
    settings.merge_rules[MergeRule::MappingAtSection] = MergeAction::KeepUser;
    settings.merge_rules[MergeRule::SectionAtMapping] = MergeAction::KeepUser;

    merge(user, defaults, settings);

    EXPECT_EQ(user.find(Route{"a"})->as_value(), 1);
    EXPECT_TRUE(user.find(Route{"b"})->is_section());
}

TEST(MergeRules, MissingMismatchRuleThrows) {
    Node user = node_from_value({{"s", {{"a", 1}}}});
    Node defaults = node_from_value({{"s", {{"a", {{"deep", 1}}}}}});
    UpdaterSettings settings;
    settings.merge_rules.clear();

    try {
        merge(user, defaults, settings);
        FAIL() << "Expected UnconfiguredMergeConflict";
    } catch (const UnconfiguredMergeConflict& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("s.a"), std::string::npos);
        EXPECT_NE(msg.find("mapping_at_section"), std::string::npos);
    }
}

TEST(MergeRules, MissingMappingsRuleKeepsUser) {
    Node user = node_from_value({{"y", true}});
    Node defaults = node_from_value({{"y", false}});
    UpdaterSettings settings;
    settings.merge_rules.clear();

    merge(user, defaults, settings);

    EXPECT_EQ(user.find(Route{"y"})->as_value(), true);
}

// ============================================================================
// Ignored nodes
// ============================================================================

TEST(MergeIgnored, IgnoredNodeImmuneToConflictingDefaults) {
    Node user = node_from_value({{"plugins", {{"custom", 1}}}});
    Node defaults = node_from_value({{"plugins", "none"}});
    user.find(Route{"plugins"})->set_ignored(true);

    MergeReport report = merge(user, defaults, UpdaterSettings{});

    ASSERT_TRUE(user.find(Route{"plugins"})->is_section());
    EXPECT_EQ(user.find(Route{"plugins", "custom"})->as_value(), 1);
    EXPECT_TRUE(report.replaced.empty());
}

TEST(MergeIgnored, IgnoredSectionNotRecursedOrPruned) {
    Node user = node_from_value({{"s", {{"legacy", 1}}}});
    Node defaults = node_from_value({{"s", {{"fresh", 2}}}});
    user.find(Route{"s"})->set_ignored(true);

    merge(user, defaults, UpdaterSettings{});

    EXPECT_TRUE(user.contains(Route{"s", "legacy"}));
    EXPECT_FALSE(user.contains(Route{"s", "fresh"}));
}

TEST(MergeIgnored, IgnoredUnusedKeyNotRemoved) {
    Node user = node_from_value({{"local", 1}});
    Node defaults = node_from_value({{"a", 1}});
    user.find(Route{"local"})->set_ignored(true);

    merge(user, defaults, UpdaterSettings{});

    EXPECT_TRUE(user.contains(Route{"local"}));
}

TEST(MergeIgnored, IgnoredRootIsLeftAlone) {
    Node user = node_from_value({{"a", 1}});
    Node defaults = node_from_value({{"b", 1}});
    user.set_ignored(true);

    merge(user, defaults, UpdaterSettings{});

    EXPECT_EQ(user, node_from_value({{"a", 1}}));
    EXPECT_FALSE(user.ignored());
}

TEST(MergeIgnored, FlagsClearedAfterMerge) {
    Node user = node_from_value({
        {"s", {{"legacy", 1}, {"inner", {{"x", 1}}}}},
        {"local", 1},
        {"kept", 2}
    });
    Node defaults = node_from_value({{"s", "flat"}});
    user.find(Route{"s"})->set_ignored(true);
    user.find(Route{"s", "inner"})->set_ignored(true);
    user.find(Route{"local"})->set_ignored(true);

    merge(user, defaults, UpdaterSettings{});

    EXPECT_TRUE(user.find(Route{"s"})->is_section());
    EXPECT_FALSE(user.find(Route{"s"})->ignored());
    EXPECT_FALSE(user.find(Route{"s", "inner"})->ignored());
    EXPECT_FALSE(user.find(Route{"local"})->ignored());
    EXPECT_FALSE(user.contains(Route{"kept"}));
    // Same as the document read back from disk
    EXPECT_EQ(user, node_from_value(node_to_value(user)));
}

TEST(MergeIgnored, FlagsClearedWithKeepAll) {
    Node user = node_from_value({{"local", 1}});
    Node defaults = node_from_value({{"a", 1}});
    user.find(Route{"local"})->set_ignored(true);
    UpdaterSettings settings;
    settings.keep_all = true;

    merge(user, defaults, settings);

    EXPECT_TRUE(user.contains(Route{"local"}));
    EXPECT_FALSE(user.find(Route{"local"})->ignored());
}

// ============================================================================
// Errors
// ============================================================================

TEST(Merge, NonSectionRootsThrow) {
    Node value(Value(1));
    Node section;
    EXPECT_THROW(merge(value, section, UpdaterSettings{}), TypeError);
    EXPECT_THROW(merge(section, value, UpdaterSettings{}), TypeError);
}
