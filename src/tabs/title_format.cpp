#include "title_format.hpp"

#include <cstdlib>

namespace tabhost
{

std::string abbreviate_home(const std::filesystem::path& path, const std::string& home)
{
    std::string dir = path.string();

    std::string home_dir = home;
    if (home_dir.empty())
    {
        const char* env = std::getenv("HOME");
        if (env)
            home_dir = env;
    }
    while (home_dir.size() > 1 && home_dir.back() == '/')
        home_dir.pop_back();

    if (home_dir.empty() || dir.compare(0, home_dir.size(), home_dir) != 0)
        return dir;
    if (dir.size() == home_dir.size())
        return "~";
    if (dir[home_dir.size()] == '/')
        return "~" + dir.substr(home_dir.size());
    return dir;
}

std::string expand_title(const std::string& format, const TitleContext& context)
{
    std::string out;
    out.reserve(format.size() + context.window_title.size());

    for (size_t i = 0; i < format.size(); ++i)
    {
        char c = format[i];
        if (c != '%' || i + 1 >= format.size())
        {
            out += c;
            continue;
        }

        char token = format[i + 1];
        switch (token)
        {
            case 't':
                out += context.window_title;
                break;
            case 'p':
                out += context.profile_name;
                break;
            case 'w':
                out += abbreviate_home(context.working_directory);
                break;
            case '%':
                out += '%';
                break;
            default:
                out += c;
                out += token;
                break;
        }
        ++i;
    }
    return out;
}

}   // namespace tabhost
