#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <unistd.h>

#include "config/config.hpp"

using namespace tabhost;

namespace fs = std::filesystem;

// ─── Defaults ────────────────────────────────────────────────────────────────

TEST(ConfigDefaults, DefaultConstructed)
{
    Config config;
    EXPECT_EQ(config.background_color, DEFAULT_BACKGROUND_COLOR);
    EXPECT_EQ(config.content.command, "neovide");
    EXPECT_EQ(config.content.window_title, "Neovide");
    EXPECT_EQ(config.content.window_class, "neovide");
    ASSERT_EQ(config.profiles.size(), 1u);
    EXPECT_EQ(config.default_profile().name, DEFAULT_PROFILE_NAME);
    EXPECT_EQ(config.default_profile().title, DEFAULT_TITLE_FORMAT);
    EXPECT_EQ(config.default_profile().icon, DEFAULT_ICON);
}

TEST(ConfigDefaults, ProfileOutOfRange)
{
    Config config;
    EXPECT_NE(config.profile(0), nullptr);
    EXPECT_EQ(config.profile(1), nullptr);
}

TEST(ConfigDefaults, LaunchCommandExpandsSize)
{
    Config config;
    auto   argv = config.content.launch_command().build_argv(800, 600);
    std::vector<std::string> expected = {"neovide", "--frame", "none", "--size", "800x600"};
    EXPECT_EQ(argv, expected);
}

TEST(ConfigDefaults, EmptyObjectGivesDefaults)
{
    auto config = Config::parse("{}");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->background_color, DEFAULT_BACKGROUND_COLOR);
    ASSERT_EQ(config->profiles.size(), 1u);
    EXPECT_EQ(config->profiles[0].name, DEFAULT_PROFILE_NAME);
}

TEST(ConfigDefaults, NonObjectRejected)
{
    EXPECT_FALSE(Config::parse("[1, 2]").has_value());
    EXPECT_FALSE(Config::parse("not json").has_value());
    EXPECT_FALSE(Config::parse("").has_value());
}

// ─── Parsing ─────────────────────────────────────────────────────────────────

TEST(ConfigParse, FullDocument)
{
    const char* json = R"({
        // editor settings
        "background_color": "#102030",
        "content": {
            "command": "nvim-qt",
            "args": ["--nofork", "--geometry", "{width}x{height}"],
            "window_title": "",
            "window_class": "nvim-qt"
        },
        /* profiles */
        "profiles": [
            { "name": "Scratch", "icon": "s.png", "working_directory": "~", "title": "%p" },
            { "name": "Default", "title": "%t - %w" }
        ]
    })";

    auto config = Config::parse(json);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->background_color, 0x102030u);

    EXPECT_EQ(config->content.command, "nvim-qt");
    std::vector<std::string> args = {"--nofork", "--geometry", "{width}x{height}"};
    EXPECT_EQ(config->content.args, args);
    EXPECT_EQ(config->content.window_title, "");
    EXPECT_EQ(config->content.window_class, "nvim-qt");

    ASSERT_EQ(config->profiles.size(), 2u);
    EXPECT_EQ(config->profiles[0].name, "Default");
    EXPECT_EQ(config->profiles[0].title, "%t - %w");
    EXPECT_EQ(config->profiles[1].name, "Scratch");
    EXPECT_EQ(config->profiles[1].icon, "s.png");
    EXPECT_EQ(config->profiles[1].title, "%p");
    EXPECT_EQ(config->profiles[1].working_directory, home_directory());
}

TEST(ConfigParse, DefaultInsertedWhenMissing)
{
    auto config = Config::parse(R"({"profiles": [{"name": "Work"}, {"name": "Play"}]})");
    ASSERT_TRUE(config.has_value());
    ASSERT_EQ(config->profiles.size(), 3u);
    EXPECT_EQ(config->profiles[0].name, "Default");
    EXPECT_EQ(config->profiles[1].name, "Work");
    EXPECT_EQ(config->profiles[2].name, "Play");
}

TEST(ConfigParse, ProfileWithoutNameSkipped)
{
    auto config = Config::parse(R"({"profiles": [{"icon": "x.png"}, {"name": "Work"}]})");
    ASSERT_TRUE(config.has_value());
    ASSERT_EQ(config->profiles.size(), 2u);
    EXPECT_EQ(config->profiles[1].name, "Work");
}

TEST(ConfigParse, InvalidColorKeepsDefault)
{
    auto config = Config::parse(R"({"background_color": "#12345"})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->background_color, DEFAULT_BACKGROUND_COLOR);
}

TEST(ConfigParse, CommentMarkersInsideStrings)
{
    auto config = Config::parse(R"({"content": {"command": "/opt/bin//nvim", "args": ["/* x */"]}})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->content.command, "/opt/bin//nvim");
    ASSERT_EQ(config->content.args.size(), 1u);
    EXPECT_EQ(config->content.args[0], "/* x */");
}

TEST(ConfigParse, EscapedQuotes)
{
    auto config = Config::parse(R"({"profiles": [{"name": "say \"hi\""}]})");
    ASSERT_TRUE(config.has_value());
    ASSERT_EQ(config->profiles.size(), 2u);
    EXPECT_EQ(config->profiles[1].name, "say \"hi\"");
}

TEST(ConfigParse, MissingWorkingDirectoryFallsBackToHome)
{
    auto config = Config::parse(
        R"({"profiles": [{"name": "Gone", "working_directory": "/nonexistent/tabhost-dir"}]})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->profiles[1].working_directory, home_directory());
}

// ─── Helpers ─────────────────────────────────────────────────────────────────

TEST(ConfigHelpers, ParseHexColor)
{
    EXPECT_EQ(parse_hex_color("#ff8000").value_or(0), 0xff8000u);
    EXPECT_EQ(parse_hex_color("A0B0C0").value_or(0), 0xa0b0c0u);
    EXPECT_FALSE(parse_hex_color("#fff").has_value());
    EXPECT_FALSE(parse_hex_color("#gg0000").has_value());
}

TEST(ConfigHelpers, StripComments)
{
    EXPECT_EQ(strip_json_comments("{\"a\": 1} // tail"), "{\"a\": 1} ");
    EXPECT_EQ(strip_json_comments("{/* x */\"a\": \"//\"}"), "{ \"a\": \"//\"}");
}

TEST(ConfigHelpers, ResolvePathExpandsTilde)
{
    fs::path home = fs::temp_directory_path();
    EXPECT_EQ(resolve_path("~", home), home);
    EXPECT_EQ(resolve_path("~/src", home), home / "src");
}

TEST(ConfigHelpers, ResolvePathKeepsExistingDirectory)
{
    fs::path dir = fs::temp_directory_path();
    EXPECT_EQ(resolve_path(dir.string(), "/home/nobody"), dir);
}

TEST(ConfigHelpers, EnsureDefaultMovesToFront)
{
    std::vector<Profile> profiles(2);
    profiles[0].name = "Work";
    profiles[1].name = "Default";
    ensure_default_profile(profiles);
    ASSERT_EQ(profiles.size(), 2u);
    EXPECT_EQ(profiles[0].name, "Default");
    EXPECT_EQ(profiles[1].name, "Work");
}

// ─── Files ───────────────────────────────────────────────────────────────────

class ConfigFileTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() / ("tabhost_config_test_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
        path_ = dir_ / "config.json";
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const std::string& text)
    {
        std::ofstream out(path_);
        out << text;
    }

    fs::path dir_;
    fs::path path_;
};

TEST_F(ConfigFileTest, LoadMissingFileGivesDefaults)
{
    Config config = Config::load((dir_ / "absent.json").string());
    EXPECT_EQ(config.content.command, "neovide");
    EXPECT_EQ(config.profiles.size(), 1u);
}

TEST_F(ConfigFileTest, LoadMalformedFileGivesDefaults)
{
    write("this is not json");
    Config config = Config::load(path_.string());
    EXPECT_EQ(config.background_color, DEFAULT_BACKGROUND_COLOR);
}

TEST_F(ConfigFileTest, LoadReadsFile)
{
    write(R"({"content": {"command": "sleep"}})");
    Config config = Config::load(path_.string());
    EXPECT_EQ(config.content.command, "sleep");
}

TEST_F(ConfigFileTest, WatcherReportsEachChangeOnce)
{
    ConfigWatcher watcher(path_);
    EXPECT_FALSE(watcher.poll());

    write("{}");
    EXPECT_TRUE(watcher.poll());
    EXPECT_FALSE(watcher.poll());

    auto later = fs::last_write_time(path_) + std::chrono::seconds(2);
    fs::last_write_time(path_, later);
    EXPECT_TRUE(watcher.poll());
    EXPECT_FALSE(watcher.poll());

    fs::remove(path_);
    EXPECT_TRUE(watcher.poll());
    EXPECT_FALSE(watcher.poll());
}
