#include "window_locator.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace tabhost
{

namespace
{

std::string to_lower(std::string text)
{
    std::transform(text.begin(),
                   text.end(),
                   text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}   // namespace

WindowPredicate WindowMatch::predicate() const
{
    return [title = title, window_class = window_class](const WindowInfo& info)
    {
        if (!title.empty() && info.title != title)
            return false;
        if (!window_class.empty() && info.window_class != window_class)
            return false;
        return true;
    };
}

WindowLocator::WindowLocator(std::shared_ptr<WindowSystem> windows, WindowPredicate predicate)
    : windows_(std::move(windows)), predicate_(std::move(predicate))
{
}

std::optional<WindowInfo> WindowLocator::find(ProcessId pid) const
{
    std::optional<WindowInfo> found;
    if (!windows_ || pid <= 0)
        return found;

    windows_->enumerate_windows(
        [&](const WindowInfo& info)
        {
            if (info.pid != pid)
                return true;
            if (predicate_ && !predicate_(info))
                return true;
            found = info;
            return false;
        });
    return found;
}

std::vector<WindowInfo> WindowLocator::list_matching(const std::string& search) const
{
    std::vector<WindowInfo> result;
    if (!windows_)
        return result;

    const std::string needle = to_lower(search);
    windows_->enumerate_windows(
        [&](const WindowInfo& info)
        {
            if (needle.empty() || to_lower(info.title).find(needle) != std::string::npos
                || to_lower(info.window_class).find(needle) != std::string::npos)
            {
                result.push_back(info);
            }
            return true;
        });
    return result;
}

}   // namespace tabhost
