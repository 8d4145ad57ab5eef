#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../process/child_process.hpp"
#include "../tabs/title_format.hpp"
#include "../window/window_locator.hpp"

namespace tabhost
{

inline constexpr uint32_t    DEFAULT_BACKGROUND_COLOR = 0x1a1b26;
inline constexpr const char* DEFAULT_PROFILE_NAME     = "Default";
inline constexpr const char* DEFAULT_ICON             = "neovide.png";

// A named recipe for new tabs.
struct Profile
{
    std::string           name;
    std::string           icon = DEFAULT_ICON;
    std::filesystem::path working_directory;
    std::string           title = DEFAULT_TITLE_FORMAT;

    // "Default" profile rooted at the home directory.
    static Profile default_profile();
};

// The external program every tab runs, and how to recognise its window.
struct ContentProgram
{
    std::string              command = "neovide";
    std::vector<std::string> args    = {"--frame", "none", "--size", "{width}x{height}"};
    std::string              window_title = "Neovide";
    std::string              window_class = "neovide";

    LaunchCommand launch_command() const { return LaunchCommand{command, args}; }
    WindowMatch   window_match() const { return WindowMatch{window_title, window_class}; }
};

// Parsed configuration. profiles is never empty and profiles[0] is always
// the "Default" profile.
//
// File format (JSON, // and /* */ comments allowed):
//   {
//     "background_color": "#1a1b26",
//     "content": { "command": "neovide", "args": [...],
//                  "window_title": "Neovide", "window_class": "neovide" },
//     "profiles": [ { "name": "Work", "icon": "work.png",
//                     "working_directory": "~/work", "title": "%p: %t" } ]
//   }
struct Config
{
    uint32_t             background_color = DEFAULT_BACKGROUND_COLOR;
    ContentProgram       content;
    std::vector<Profile> profiles = {Profile::default_profile()};

    const Profile& default_profile() const { return profiles.front(); }
    const Profile* profile(size_t index) const
    {
        return index < profiles.size() ? &profiles[index] : nullptr;
    }

    // Parse a config document. Returns nullopt if it is not a JSON object.
    // Individual bad values fall back to their defaults.
    static std::optional<Config> parse(const std::string& json);

    // Load from path; defaults if the file is missing or malformed.
    static Config load(const std::string& path);

    // ~/.config/tabhost/config.json, or config.jsonc if only that exists.
    static std::string default_path();
};

// Removes // line and /* block */ comments outside string literals.
std::string strip_json_comments(const std::string& text);

// "#rrggbb" or "rrggbb".
std::optional<uint32_t> parse_hex_color(std::string_view text);

// Expands a leading '~' to home. Other paths must name an existing
// directory, otherwise home is returned.
std::filesystem::path resolve_path(const std::string& path, const std::filesystem::path& home);

// Ensures a "Default" profile exists and sits at index 0.
void ensure_default_profile(std::vector<Profile>& profiles);

std::filesystem::path home_directory();

// Detects edits to the config file by polling its modification time.
class ConfigWatcher
{
   public:
    explicit ConfigWatcher(std::filesystem::path path);

    // True once per change (including the file appearing or disappearing).
    bool poll();

    const std::filesystem::path& path() const { return path_; }

   private:
    std::optional<std::filesystem::file_time_type> current_mtime() const;

    std::filesystem::path                          path_;
    std::optional<std::filesystem::file_time_type> last_mtime_;
};

}   // namespace tabhost
