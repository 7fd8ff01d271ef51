#include <gtest/gtest.h>

#include "core/key_bindings.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace keychord;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace
{
std::vector<Binding> Defaults()
{
    return {{"quit", {"q", "esc"}, "Quit"}, {"top", {"g g"}, "Top"}, {"jump", {"space"}, "Jump"}};
}

KeyBindingsEngine MakeEngine()
{
    KeyBindingsEngine e;
    std::string err;
    EXPECT_TRUE(e.SetDefaults(Defaults(), err)) << err;
    return e;
}

const Clock::time_point t0 = Clock::time_point{} + 5s;
} // namespace

TEST(KeyBindingsEngine, StartsWithEmptyTable)
{
    KeyBindingsEngine e;
    ASSERT_TRUE(e.Table());
    EXPECT_EQ(e.Table()->Size(), 0u);
    EXPECT_EQ(e.Mode(), io::kDefaultMode);
    EXPECT_EQ(e.SequenceTimeout(), 1000ms);
}

TEST(KeyBindingsEngine, DefaultsResolve)
{
    KeyBindingsEngine e = MakeEngine();
    EXPECT_TRUE(e.ActionPressed("quit", CharKey('q')));
    EXPECT_FALSE(e.ActionPressed("jump", CharKey('q')));
    EXPECT_TRUE(e.Feed(CharKey('g'), t0).IsPending());
    EXPECT_EQ(e.Feed(CharKey('g'), t0 + 100ms).resolution.action, "top");
}

TEST(KeyBindingsEngine, LoadFromStringReplacesPerAction)
{
    KeyBindingsEngine e = MakeEngine();
    std::string err;
    ASSERT_TRUE(e.LoadFromString(R"({"quit": {"keys": ["@any"]}})", err)) << err;
    EXPECT_TRUE(e.IsLoaded());

    auto t = e.Table();
    EXPECT_EQ(t->Lookup(CharKey('x')), std::optional<std::string>("quit"));
    EXPECT_EQ(t->Lookup(CharKey(' ')), std::optional<std::string>("jump"));
    EXPECT_EQ(t->PatternsFor("quit")->size(), 1u);
}

TEST(KeyBindingsEngine, FailedLoadKeepsCurrentTable)
{
    KeyBindingsEngine e = MakeEngine();
    auto before = e.Table();

    std::string err;
    EXPECT_FALSE(e.LoadFromString(R"({"jump": {"keys": ["q"]}})", err));
    EXPECT_NE(err.find("bound to both"), std::string::npos) << err;
    EXPECT_EQ(e.Table(), before);
    EXPECT_EQ(e.LastError(), err);

    EXPECT_FALSE(e.LoadFromString("{not json", err));
    EXPECT_EQ(e.Table(), before);
}

TEST(KeyBindingsEngine, InstallingTableResetsPendingSequence)
{
    KeyBindingsEngine e = MakeEngine();
    EXPECT_TRUE(e.Feed(CharKey('g'), t0).IsPending());
    std::string err;
    ASSERT_TRUE(e.LoadFromString(R"({"schema_version": 1, "actions": []})", err)) << err;
    EXPECT_FALSE(e.IsSequencePending());
}

TEST(KeyBindingsEngine, MissingFileFallsBackToDefaults)
{
    KeyBindingsEngine e = MakeEngine();
    std::string err;
    ASSERT_TRUE(e.LoadFromString(R"({"quit": {"keys": ["x"]}})", err)) << err;

    EXPECT_FALSE(e.LoadFromFile("/nonexistent/keychord/key-bindings.json", err));
    EXPECT_FALSE(err.empty());
    EXPECT_TRUE(e.IsLoaded());
    EXPECT_TRUE(e.ActionPressed("quit", CharKey('q')));
    EXPECT_EQ(e.Path(), "/nonexistent/keychord/key-bindings.json");
}

TEST(KeyBindingsEngine, ModesSwapTables)
{
    KeyBindingsEngine e = MakeEngine();
    std::string err;
    ASSERT_TRUE(e.LoadFromString(R"({
        "schema_version": 1,
        "modes": {
            "home": {"actions": [{"id": "start", "keys": ["enter"]}, {"id": "quit", "keys": ["q"]}]},
            "game": {"actions": [{"id": "shoot", "keys": ["@any"]}, {"id": "pause", "keys": ["esc"]}]}
        }
    })", err)) << err;

    const std::vector<std::string> modes = e.Modes();
    EXPECT_EQ(modes, (std::vector<std::string>{"default", "game", "home"}));

    EXPECT_FALSE(e.SetMode("menu"));
    ASSERT_TRUE(e.SetMode("game"));
    EXPECT_EQ(e.Mode(), "game");

    const MatchOutcome out = e.Feed(CharKey('x'), t0);
    ASSERT_TRUE(out.IsMatched());
    EXPECT_EQ(out.resolution.action, "shoot");
    EXPECT_EQ(out.resolution.captured, std::optional<char>('x'));

    ASSERT_TRUE(e.SetMode("home"));
    EXPECT_TRUE(e.ActionPressed("start", NamedKeySpec(NamedKey::Enter)));
    // Defaults of the base mode are untouched.
    EXPECT_TRUE(e.TableFor("default")->Lookup(NamedKeySpec(NamedKey::Esc)).has_value());
}

TEST(KeyBindingsEngine, ModeDefaultsMergeWithFileMode)
{
    KeyBindingsEngine e;
    std::string err;
    ASSERT_TRUE(e.SetModeDefaults("game", {{"shoot", {"f"}, ""}, {"pause", {"p"}, ""}}, err)) << err;
    ASSERT_TRUE(e.LoadFromString(R"({"modes": {"game": {"shoot": {"keys": ["@any"]}}}})", err)) << err;
    auto t = e.TableFor("game");
    ASSERT_TRUE(t);
    EXPECT_EQ(t->Lookup(CharKey('p')), std::optional<std::string>("pause"));
    EXPECT_EQ(t->Lookup(CharKey('f')), std::optional<std::string>("shoot"));
}

TEST(KeyBindingsEngine, SaveThenLoadRoundTrip)
{
    const fs::path path = fs::temp_directory_path() / "keychord_engine_test.json";

    KeyBindingsEngine e = MakeEngine();
    std::string err;
    ASSERT_TRUE(e.LoadFromString(R"({"quit": {"keys": ["ctrl-c"], "description": "Exit"}})", err)) << err;
    ASSERT_TRUE(e.SaveToFile(path.string(), err)) << err;

    KeyBindingsEngine other;
    ASSERT_TRUE(other.LoadFromFile(path.string(), err)) << err;
    auto t = other.Table();
    EXPECT_EQ(t->Size(), 3u);
    EXPECT_EQ(t->Find("quit")->description, "Exit");
    EXPECT_TRUE(other.ActionPressed("quit", CharKey('c', Mods{true, false, false, false})));

    std::error_code ec;
    fs::remove(path, ec);
}

TEST(KeyBindingsEngine, BadDefaultsAreRejected)
{
    KeyBindingsEngine e = MakeEngine();
    std::string err;
    EXPECT_FALSE(e.SetDefaults({{"a", {"q"}, ""}, {"b", {"q"}, ""}}, err));
    EXPECT_TRUE(e.ActionPressed("quit", CharKey('q')));
}

TEST(KeyBindingsEngine, SequenceTimeoutIsConfigurable)
{
    KeyBindingsEngine e = MakeEngine();
    e.SetSequenceTimeout(200ms);
    EXPECT_TRUE(e.Feed(CharKey('g'), t0).IsPending());
    EXPECT_TRUE(e.Feed(CharKey('g'), t0 + 300ms).IsPending());
    EXPECT_TRUE(e.Feed(CharKey('g'), t0 + 400ms).IsMatched());
}
