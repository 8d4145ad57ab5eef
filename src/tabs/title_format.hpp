#pragma once

#include <filesystem>
#include <functional>
#include <string>

namespace tabhost
{

inline constexpr const char* DEFAULT_TITLE_FORMAT = "%t";

struct TitleContext
{
    std::string           profile_name;
    std::filesystem::path working_directory;
    std::string           window_title;
};

// Expands a tab title format:
//   %t  current window title of the content program
//   %p  profile name
//   %w  working directory, with $HOME shown as ~
//   %%  a literal percent sign
// Unknown tokens and a trailing '%' are copied as-is.
std::string expand_title(const std::string& format, const TitleContext& context);

// Shortens paths under home to "~" / "~/...". home defaults to $HOME.
std::string abbreviate_home(const std::filesystem::path& path, const std::string& home = {});

using TitleFormatter = std::function<std::string(const std::string&, const TitleContext&)>;

}   // namespace tabhost
