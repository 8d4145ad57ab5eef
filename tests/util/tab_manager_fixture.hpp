#pragma once

#include <string>
#include <vector>

#include "tabs/tab_manager.hpp"
#include "util/supervisor_fixture.hpp"

namespace tabhost::test
{

class TabManagerFixture : public SupervisorFixture
{
   protected:
    void SetUp() override { manager_ = std::make_unique<TabManager>(make_options()); }
    void TearDown() override { manager_.reset(); }

    static Profile make_profile(const std::string& name)
    {
        Profile profile;
        profile.name              = name;
        profile.working_directory = std::filesystem::temp_directory_path();
        return profile;
    }

    // Adds tabs named A, B, C, ... using profile indices 0, 1, 2, ...
    void add_tabs(size_t count)
    {
        for (size_t i = 0; i < count; ++i)
        {
            std::string name(1, static_cast<char>('A' + manager_->count()));
            auto        result = manager_->create_tab(PixelSize{800, 600}, make_profile(name), manager_->count());
            ASSERT_TRUE(result) << result.message;
        }
    }

    // Gives tab index a window and waits for discovery to publish it.
    WindowId make_ready(size_t index, const std::string& title = "Neovide")
    {
        const Tab* tab = manager_->tab(index);
        EXPECT_NE(tab, nullptr);
        if (!tab)
            return INVALID_WINDOW_ID;
        WindowId window = give_window(tab->supervisor->pid(), title);
        EXPECT_TRUE(wait_until([&] { return tab->supervisor->is_ready(); }));
        return window;
    }

    std::vector<TabId> order() const
    {
        std::vector<TabId> ids;
        for (size_t i = 0; i < manager_->count(); ++i)
            ids.push_back(manager_->tab(i)->id);
        return ids;
    }

    TabId selected_id() const
    {
        const Tab* tab = manager_->selected_tab();
        return tab ? tab->id : INVALID_TAB_ID;
    }

    std::unique_ptr<TabManager> manager_;
};

}   // namespace tabhost::test
