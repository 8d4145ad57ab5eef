#include "config.hpp"

#include <tabhost/logger.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <utility>

namespace tabhost
{

// ─── Minimal JSON readers ────────────────────────────────────────────────────
// Just enough JSON for the config file: string values, arrays of strings and
// arrays of objects, located by key. String literals are skipped while
// scanning so braces inside values (e.g. "{width}") do not confuse nesting.

// Index one past the closing quote of the string starting at json[pos].
static size_t skip_json_string(const std::string& json, size_t pos)
{
    size_t i = pos + 1;
    while (i < json.size())
    {
        if (json[i] == '\\')
            i += 2;
        else if (json[i] == '"')
            return i + 1;
        else
            ++i;
    }
    return std::string::npos;
}

static size_t skip_ws(const std::string& json, size_t pos)
{
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos])))
        ++pos;
    return pos;
}

static std::string unescape_json(const std::string& raw)
{
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i)
    {
        if (raw[i] != '\\' || i + 1 >= raw.size())
        {
            out += raw[i];
            continue;
        }
        char c = raw[++i];
        switch (c)
        {
            case 'n':
                out += '\n';
                break;
            case 't':
                out += '\t';
                break;
            case 'r':
                out += '\r';
                break;
            case 'b':
                out += '\b';
                break;
            case 'f':
                out += '\f';
                break;
            default:
                // \" \\ \/ and anything unknown: keep the character itself.
                out += c;
                break;
        }
    }
    return out;
}

// Position of the value following "key": anywhere in json, or npos.
static size_t find_json_value(const std::string& json, const std::string& key)
{
    size_t i = 0;
    while (i < json.size())
    {
        if (json[i] != '"')
        {
            ++i;
            continue;
        }
        size_t end = skip_json_string(json, i);
        if (end == std::string::npos)
            return std::string::npos;

        if (json.compare(i + 1, end - i - 2, key) == 0 && end - i - 2 == key.size())
        {
            size_t colon = skip_ws(json, end);
            if (colon < json.size() && json[colon] == ':')
                return skip_ws(json, colon + 1);
        }
        i = end;
    }
    return std::string::npos;
}

// The balanced {...} or [...] starting at json[pos], or empty.
static std::string read_json_block(const std::string& json, size_t pos)
{
    if (pos >= json.size() || (json[pos] != '{' && json[pos] != '['))
        return {};

    int depth = 0;
    for (size_t i = pos; i < json.size();)
    {
        char c = json[i];
        if (c == '"')
        {
            i = skip_json_string(json, i);
            if (i == std::string::npos)
                return {};
            continue;
        }
        if (c == '{' || c == '[')
            ++depth;
        else if (c == '}' || c == ']')
        {
            if (--depth == 0)
                return json.substr(pos, i - pos + 1);
        }
        ++i;
    }
    return {};
}

static std::optional<std::string> read_json_string(const std::string& json, const std::string& key)
{
    size_t pos = find_json_value(json, key);
    if (pos == std::string::npos || json[pos] != '"')
        return std::nullopt;
    size_t end = skip_json_string(json, pos);
    if (end == std::string::npos)
        return std::nullopt;
    return unescape_json(json.substr(pos + 1, end - pos - 2));
}

static std::optional<std::vector<std::string>> read_json_string_array(const std::string& json,
                                                                      const std::string& key)
{
    size_t pos = find_json_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    std::string block = read_json_block(json, pos);
    if (block.empty() || block.front() != '[')
        return std::nullopt;

    std::vector<std::string> items;
    size_t                   i = 1;
    while (i < block.size())
    {
        if (block[i] == '"')
        {
            size_t end = skip_json_string(block, i);
            if (end == std::string::npos)
                return std::nullopt;
            items.push_back(unescape_json(block.substr(i + 1, end - i - 2)));
            i = end;
        }
        else
        {
            ++i;
        }
    }
    return items;
}

static std::string read_json_object(const std::string& json, const std::string& key)
{
    size_t pos = find_json_value(json, key);
    if (pos == std::string::npos)
        return {};
    std::string block = read_json_block(json, pos);
    if (block.empty() || block.front() != '{')
        return {};
    return block;
}

// Top-level objects of the array stored under key.
static std::optional<std::vector<std::string>> read_json_object_array(const std::string& json,
                                                                      const std::string& key)
{
    size_t pos = find_json_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    std::string block = read_json_block(json, pos);
    if (block.empty() || block.front() != '[')
        return std::nullopt;

    std::vector<std::string> objects;
    size_t                   i = 1;
    while (i < block.size())
    {
        if (block[i] == '"')
        {
            i = skip_json_string(block, i);
            if (i == std::string::npos)
                break;
            continue;
        }
        if (block[i] == '{')
        {
            std::string object = read_json_block(block, i);
            if (object.empty())
                break;
            i += object.size();
            objects.push_back(std::move(object));
            continue;
        }
        ++i;
    }
    return objects;
}

// ─── Helpers ─────────────────────────────────────────────────────────────────

std::string strip_json_comments(const std::string& text)
{
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size())
    {
        char c = text[i];
        if (c == '"')
        {
            size_t end = skip_json_string(text, i);
            if (end == std::string::npos)
                end = text.size();
            out.append(text, i, end - i);
            i = end;
        }
        else if (c == '/' && i + 1 < text.size() && text[i + 1] == '/')
        {
            while (i < text.size() && text[i] != '\n')
                ++i;
        }
        else if (c == '/' && i + 1 < text.size() && text[i + 1] == '*')
        {
            size_t end = text.find("*/", i + 2);
            i          = end == std::string::npos ? text.size() : end + 2;
            out += ' ';
        }
        else
        {
            out += c;
            ++i;
        }
    }
    return out;
}

std::optional<uint32_t> parse_hex_color(std::string_view text)
{
    if (!text.empty() && text.front() == '#')
        text.remove_prefix(1);
    if (text.size() != 6)
        return std::nullopt;

    uint32_t value = 0;
    for (char c : text)
    {
        int digit = 0;
        if (c >= '0' && c <= '9')
            digit = c - '0';
        else if (c >= 'a' && c <= 'f')
            digit = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F')
            digit = c - 'A' + 10;
        else
            return std::nullopt;
        value = (value << 4) | static_cast<uint32_t>(digit);
    }
    return value;
}

std::filesystem::path home_directory()
{
    const char* home = std::getenv("HOME");
    if (!home || !*home)
        return std::filesystem::path(".");
    return std::filesystem::path(home);
}

std::filesystem::path resolve_path(const std::string& path, const std::filesystem::path& home)
{
    if (!path.empty() && path.front() == '~')
    {
        std::string rest = path.substr(1);
        while (!rest.empty() && rest.front() == '/')
            rest.erase(0, 1);
        return rest.empty() ? home : home / rest;
    }

    std::error_code ec;
    if (!path.empty() && std::filesystem::is_directory(path, ec))
        return std::filesystem::path(path);

    TABHOST_LOG_WARN("config",
                     "Working directory '{}' does not exist, using {}",
                     path,
                     home.string());
    return home;
}

Profile Profile::default_profile()
{
    Profile profile;
    profile.name              = DEFAULT_PROFILE_NAME;
    profile.working_directory = home_directory();
    return profile;
}

void ensure_default_profile(std::vector<Profile>& profiles)
{
    for (size_t i = 0; i < profiles.size(); ++i)
    {
        if (profiles[i].name != DEFAULT_PROFILE_NAME)
            continue;
        if (i != 0)
        {
            Profile def = std::move(profiles[i]);
            profiles.erase(profiles.begin() + static_cast<std::ptrdiff_t>(i));
            profiles.insert(profiles.begin(), std::move(def));
        }
        return;
    }
    profiles.insert(profiles.begin(), Profile::default_profile());
}

// ─── Config ──────────────────────────────────────────────────────────────────

std::optional<Config> Config::parse(const std::string& json)
{
    std::string text  = strip_json_comments(json);
    size_t      start = skip_ws(text, 0);
    std::string root  = read_json_block(text, start);
    if (root.empty() || root.front() != '{')
        return std::nullopt;

    Config config;

    if (auto color = read_json_string(root, "background_color"))
    {
        if (auto value = parse_hex_color(*color))
            config.background_color = *value;
        else
            TABHOST_LOG_WARN("config", "Invalid background_color '{}', using default", *color);
    }

    std::string content = read_json_object(root, "content");
    if (!content.empty())
    {
        if (auto command = read_json_string(content, "command"); command && !command->empty())
            config.content.command = *command;
        if (auto args = read_json_string_array(content, "args"))
            config.content.args = std::move(*args);
        if (auto title = read_json_string(content, "window_title"))
            config.content.window_title = *title;
        if (auto window_class = read_json_string(content, "window_class"))
            config.content.window_class = *window_class;
    }

    config.profiles.clear();
    if (auto objects = read_json_object_array(root, "profiles"))
    {
        const auto home = home_directory();
        for (const auto& object : *objects)
        {
            auto name = read_json_string(object, "name");
            if (!name || name->empty())
            {
                TABHOST_LOG_WARN("config", "Skipping profile without a name");
                continue;
            }

            Profile profile;
            profile.name = *name;
            if (auto icon = read_json_string(object, "icon"))
                profile.icon = *icon;
            if (auto dir = read_json_string(object, "working_directory"))
                profile.working_directory = resolve_path(*dir, home);
            else
                profile.working_directory = home;
            if (auto title = read_json_string(object, "title"))
                profile.title = *title;
            config.profiles.push_back(std::move(profile));
        }
    }
    ensure_default_profile(config.profiles);

    return config;
}

Config Config::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        TABHOST_LOG_INFO("config", "No config at {}, using defaults", path);
        return Config{};
    }

    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    auto        config = parse(json);
    if (!config)
    {
        TABHOST_LOG_WARN("config", "Config {} is not a JSON object, using defaults", path);
        return Config{};
    }

    TABHOST_LOG_INFO("config",
                     "Loaded {} ({} profiles)",
                     path,
                     config->profiles.size());
    return *config;
}

std::string Config::default_path()
{
    std::filesystem::path dir = home_directory() / ".config" / "tabhost";

    std::error_code ec;
    auto            json  = dir / "config.json";
    auto            jsonc = dir / "config.jsonc";
    if (!std::filesystem::exists(json, ec) && std::filesystem::exists(jsonc, ec))
        return jsonc.string();
    return json.string();
}

// ─── ConfigWatcher ───────────────────────────────────────────────────────────

ConfigWatcher::ConfigWatcher(std::filesystem::path path) : path_(std::move(path))
{
    last_mtime_ = current_mtime();
}

std::optional<std::filesystem::file_time_type> ConfigWatcher::current_mtime() const
{
    std::error_code ec;
    auto            mtime = std::filesystem::last_write_time(path_, ec);
    if (ec)
        return std::nullopt;
    return mtime;
}

bool ConfigWatcher::poll()
{
    auto mtime = current_mtime();
    if (mtime == last_mtime_)
        return false;

    last_mtime_ = mtime;
    TABHOST_LOG_DEBUG("config", "{} changed", path_.string());
    return true;
}

}   // namespace tabhost
