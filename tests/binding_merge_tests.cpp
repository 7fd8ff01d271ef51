#include <gtest/gtest.h>

#include "core/binding_merge.h"

#include <optional>
#include <string>
#include <vector>

using namespace keychord;

TEST(BindingMerge, FileEntryReplacesDerivedEntry)
{
    const std::vector<Binding> derived = {{"quit", {"q", "esc"}, "Quit"}};
    const std::vector<Binding> file = {{"quit", {"@any"}, ""}};

    BuildError err;
    auto t = MergeBindings(derived, file, err);
    ASSERT_TRUE(t) << err.Message();
    EXPECT_EQ(t->Lookup(CharKey('x')), std::optional<std::string>("quit"));
    ASSERT_NE(t->PatternsFor("quit"), nullptr);
    EXPECT_EQ(t->PatternsFor("quit")->size(), 1u);
    // No union with the derived keys: 'q' now only reaches quit through @any.
    EXPECT_FALSE(t->LookupBound(CharKey('q'))->exact);
    EXPECT_EQ(t->Find("quit")->description, "");
}

TEST(BindingMerge, DerivedOnlyAndFileOnlyActionsSurvive)
{
    const std::vector<Binding> derived = {{"up", {"k"}, "Up"}, {"down", {"j"}, "Down"}};
    const std::vector<Binding> file = {{"down", {"n"}, "Down!"}, {"help", {"?"}, "Help"}};

    const std::vector<Binding> merged = MergeDefaultsWithFile(derived, file);
    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[0].action, "up");
    EXPECT_EQ(merged[0].keys, std::vector<std::string>{"k"});
    EXPECT_EQ(merged[1].action, "down");
    EXPECT_EQ(merged[1].keys, std::vector<std::string>{"n"});
    EXPECT_EQ(merged[1].description, "Down!");
    EXPECT_EQ(merged[2].action, "help");
}

TEST(BindingMerge, AbsentFileUsesDerivedOnly)
{
    BuildError err;
    auto t = MergeBindings({{"quit", {"q"}, ""}}, std::nullopt, err);
    ASSERT_TRUE(t);
    EXPECT_EQ(t->Size(), 1u);
}

TEST(BindingMerge, ConflictAcrossSourcesIsDetected)
{
    const std::vector<Binding> derived = {{"quit", {"q"}, ""}, {"jump", {"space"}, ""}};
    const std::vector<Binding> file = {{"jump", {"q"}, ""}};

    BuildError err;
    EXPECT_FALSE(MergeBindings(derived, file, err));
    EXPECT_EQ(err.kind, BuildError::Kind::DuplicatePattern);
    EXPECT_EQ(err.duplicate.pattern, "q");
    // Merged order is derived order, so the untouched owner comes first.
    EXPECT_EQ(err.duplicate.action_a, "quit");
    EXPECT_EQ(err.duplicate.action_b, "jump");
}

TEST(BindingMerge, ReplacedKeysNoLongerConflict)
{
    // The file moves quit off 'q', so jump may take it.
    const std::vector<Binding> derived = {{"quit", {"q"}, ""}, {"jump", {"space"}, ""}};
    const std::vector<Binding> file = {{"quit", {"esc"}, ""}, {"jump", {"q"}, ""}};

    BuildError err;
    auto t = MergeBindings(derived, file, err);
    ASSERT_TRUE(t) << err.Message();
    EXPECT_EQ(t->Lookup(CharKey('q')), std::optional<std::string>("jump"));
}

TEST(BindingMerge, RepeatedActionInFileFails)
{
    BuildError err;
    EXPECT_FALSE(MergeBindings({{"quit", {"q"}, ""}}, std::vector<Binding>{{"x", {"x"}, ""}, {"x", {"y"}, ""}}, err));
    EXPECT_EQ(err.kind, BuildError::Kind::DuplicateAction);
    EXPECT_EQ(err.action, "x");
}

TEST(BindingMerge, FileParseErrorIsReported)
{
    BuildError err;
    EXPECT_FALSE(MergeBindings({{"quit", {"q"}, ""}}, std::vector<Binding>{{"quit", {"ctrl-"}, ""}}, err));
    EXPECT_EQ(err.kind, BuildError::Kind::Parse);
    EXPECT_EQ(err.parse.position, 5u);
}
