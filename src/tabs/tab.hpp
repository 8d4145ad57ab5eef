#pragma once

#include <tabhost/fwd.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "../process/process_supervisor.hpp"

namespace tabhost
{

// One tab: the content process it owns plus the profile data it was created
// from. Destroying a Tab destroys its supervisor, which kills the process if
// it is still running.
struct Tab
{
    TabId                              id = INVALID_TAB_ID;
    std::unique_ptr<ProcessSupervisor> supervisor;
    std::string                        profile_name;
    std::string                        profile_icon;
    std::filesystem::path              working_directory;   // fixed at creation
    size_t                             profile_index = 0;
    std::string                        title_format;
    std::string                        cached_title;

    // Shared with the supervisor's locked cell.
    std::optional<SteadyTime> close_requested_at() const
    {
        return supervisor ? supervisor->close_requested_at() : std::nullopt;
    }
    bool is_pending_close() const { return close_requested_at().has_value(); }
};

}   // namespace tabhost
