#include <gtest/gtest.h>

#include <atomic>
#include <csignal>
#include <memory>
#include <string>
#include <vector>

#include "host/host_session.hpp"
#include "util/fake_window_system.hpp"

using namespace tabhost;
using tabhost::test::FakeWindowSystem;
using tabhost::test::wait_until;

// Strip of 348 px: with three tabs each is 100 px wide at lefts 8/108/208.
class HostSessionTest : public ::testing::Test
{
   protected:
    static Config make_config()
    {
        Config config;
        config.content.command = "sleep";
        config.content.args    = {"30"};

        Profile work            = Profile::default_profile();
        work.name               = "Work";
        config.profiles.push_back(work);
        return config;
    }

    std::unique_ptr<HostSession> make_session(Config           config    = make_config(),
                                              DiscoveryOptions discovery = fast_discovery())
    {
        auto session = std::make_unique<HostSession>(
            std::move(config),
            fake_,
            [] { return HostGeometry{Rect{0, 0, 348, 600}, 32, 4}; },
            discovery);
        session->set_wake_callback([wakes = wakes_] { wakes->fetch_add(1); });
        return session;
    }

    static DiscoveryOptions fast_discovery()
    {
        return DiscoveryOptions{std::chrono::milliseconds(5), 2000};
    }

    ProcessId pid_of(const HostSession& session, size_t index) const
    {
        return session.tabs().tab(index)->supervisor->pid();
    }

    WindowId make_ready(const HostSession& session, size_t index)
    {
        const Tab* tab    = session.tabs().tab(index);
        WindowId   window = fake_->add_window(tab->supervisor->pid(), "Neovide", "neovide");
        EXPECT_TRUE(wait_until([&] { return tab->supervisor->is_ready(); }));
        return window;
    }

    std::shared_ptr<FakeWindowSystem>  fake_  = std::make_shared<FakeWindowSystem>();
    std::shared_ptr<std::atomic<int>>  wakes_ = std::make_shared<std::atomic<int>>(0);
};

// ─── Tab commands ────────────────────────────────────────────────────────────

TEST_F(HostSessionTest, StartOpensDefaultTab)
{
    auto session = make_session();
    EXPECT_EQ(session->start(), HostAction::Repaint);
    ASSERT_EQ(session->tabs().count(), 1u);
    EXPECT_EQ(session->tabs().tab_label(0), "Default");
    EXPECT_TRUE(session->error_message().empty());
}

TEST_F(HostSessionTest, SpawnFailureSetsErrorMessage)
{
    Config config          = make_config();
    config.content.command = "/nonexistent/tabhost-missing";
    auto session           = make_session(config);

    EXPECT_EQ(session->start(), HostAction::Repaint);
    EXPECT_TRUE(session->tabs().empty());
    EXPECT_FALSE(session->error_message().empty());

    session->clear_error();
    EXPECT_TRUE(session->error_message().empty());
}

TEST_F(HostSessionTest, UnknownProfileUsesDefault)
{
    auto session = make_session();
    session->on_new_tab_requested(9);
    ASSERT_EQ(session->tabs().count(), 1u);
    EXPECT_EQ(session->tabs().tab(0)->profile_index, 0u);
    EXPECT_EQ(session->tabs().tab_label(0), "Default");
}

TEST_F(HostSessionTest, ProfileHotkeyReusesExistingTab)
{
    auto session = make_session();
    session->start();

    session->on_profile_hotkey(1);
    ASSERT_EQ(session->tabs().count(), 2u);
    EXPECT_EQ(session->tabs().tab_label(1), "Work");
    EXPECT_EQ(session->tabs().selected_index(), 1u);

    session->on_tab_clicked(0);
    session->on_profile_hotkey(1);
    EXPECT_EQ(session->tabs().count(), 2u);
    EXPECT_EQ(session->tabs().selected_index(), 1u);
}

TEST_F(HostSessionTest, TabClickRepaintsOnlyOnChange)
{
    auto session = make_session();
    session->start();
    session->on_new_tab_requested(0);

    EXPECT_EQ(session->on_tab_clicked(0), HostAction::Repaint);
    EXPECT_EQ(session->on_tab_clicked(0), HostAction::None);
    EXPECT_EQ(session->on_tab_clicked(5), HostAction::None);
}

TEST_F(HostSessionTest, SwitchingTabsHidesTheOthers)
{
    auto session = make_session();
    session->start();
    session->on_new_tab_requested(0);
    WindowId first  = make_ready(*session, 0);
    WindowId second = make_ready(*session, 1);

    session->on_tab_clicked(0);
    EXPECT_TRUE(fake_->visible(first));
    EXPECT_FALSE(fake_->visible(second));
    EXPECT_EQ(fake_->raised().back(), first);
}

TEST_F(HostSessionTest, CloseClickWithoutWindowClosesAndQuitsOnLast)
{
    auto session = make_session();
    session->start();
    session->on_new_tab_requested(0);

    EXPECT_EQ(session->on_tab_close_clicked(0), HostAction::Repaint);
    EXPECT_EQ(session->tabs().count(), 1u);
    EXPECT_EQ(session->on_tab_close_clicked(0), HostAction::Quit);
    EXPECT_TRUE(session->tabs().empty());
}

TEST_F(HostSessionTest, CloseClickWithWindowWaitsForExit)
{
    auto session = make_session();
    session->start();
    WindowId window = make_ready(*session, 0);
    fake_->close_kills_owner();

    EXPECT_EQ(session->on_tab_close_clicked(0), HostAction::Repaint);
    EXPECT_EQ(session->tabs().count(), 1u);
    EXPECT_EQ(fake_->close_requests(), (std::vector<WindowId>{window}));

    EXPECT_TRUE(wait_until([&] { return session->on_poll_tick() == HostAction::Quit; }));
}

// ─── Pointer ─────────────────────────────────────────────────────────────────

TEST_F(HostSessionTest, PressOnNewTabButtonOpensTab)
{
    auto session = make_session();
    session->start();
    // One tab: width 200 clamped from 300, new-tab button at x 208..240.
    EXPECT_EQ(session->on_drag_start(220, 16), HostAction::Repaint);
    EXPECT_EQ(session->tabs().count(), 2u);
}

TEST_F(HostSessionTest, PressOnCloseButtonClosesTab)
{
    auto session = make_session();
    session->start();
    session->on_new_tab_requested(0);
    session->on_new_tab_requested(0);

    // Tab 1 spans 108..208; its close button spans 186..202.
    session->on_drag_start(190, 16);
    EXPECT_EQ(session->tabs().count(), 2u);
    EXPECT_FALSE(session->tabs().drag_state().has_value());
}

TEST_F(HostSessionTest, PressAndReleaseSelects)
{
    auto session = make_session();
    session->start();
    session->on_new_tab_requested(0);
    session->on_new_tab_requested(0);
    ASSERT_EQ(session->tabs().selected_index(), 2u);

    EXPECT_EQ(session->on_drag_start(30, 16), HostAction::None);
    EXPECT_EQ(session->on_drag_move(32), HostAction::None);
    EXPECT_EQ(session->on_drag_end(33), HostAction::Repaint);
    EXPECT_EQ(session->tabs().selected_index(), 0u);
}

TEST_F(HostSessionTest, DragReordersTabs)
{
    auto session = make_session();
    session->start();
    session->on_new_tab_requested(0);
    session->on_new_tab_requested(0);
    TabId first = session->tabs().tab(0)->id;

    session->on_drag_start(50, 16);
    EXPECT_EQ(session->on_drag_move(151), HostAction::Repaint);
    session->on_drag_end(251);

    EXPECT_EQ(session->tabs().tab(2)->id, first);
    EXPECT_FALSE(session->tabs().drag_state().has_value());
    EXPECT_EQ(session->tabs().selected_index(), 1u);
}

TEST_F(HostSessionTest, ReleaseWithoutPressIgnored)
{
    auto session = make_session();
    session->start();
    EXPECT_EQ(session->on_drag_end(50), HostAction::None);
    EXPECT_EQ(session->on_drag_move(50), HostAction::None);
}

// ─── Poll tick ───────────────────────────────────────────────────────────────

TEST_F(HostSessionTest, PollActivatesWindowOnceReady)
{
    auto session = make_session();
    session->start();
    WindowId window = make_ready(*session, 0);

    EXPECT_EQ(session->on_poll_tick(), HostAction::Repaint);
    EXPECT_EQ(fake_->raised().back(), window);
    EXPECT_EQ(session->tabs().tab_label(0), "Neovide");
    EXPECT_EQ(session->on_poll_tick(), HostAction::None);
}

TEST_F(HostSessionTest, PollRepaintsOnTitleChange)
{
    auto session = make_session();
    session->start();
    WindowId window = make_ready(*session, 0);
    session->on_poll_tick();

    fake_->set_title(window, "todo.md - Neovide");
    EXPECT_EQ(session->on_poll_tick(), HostAction::Repaint);
    EXPECT_EQ(session->tabs().tab_label(0), "todo.md - Neovide");
}

TEST_F(HostSessionTest, PollRemovesExitedTabs)
{
    auto session = make_session();
    session->start();
    session->on_new_tab_requested(0);
    ::kill(pid_of(*session, 0), SIGKILL);

    EXPECT_TRUE(wait_until(
        [&]
        {
            session->on_poll_tick();
            return session->tabs().count() == 1;
        }));
    EXPECT_EQ(session->tabs().tab(0)->id, 2u);
}

TEST_F(HostSessionTest, PollQuitsWhenLastTabExits)
{
    auto session = make_session();
    session->start();
    ::kill(pid_of(*session, 0), SIGKILL);

    EXPECT_TRUE(wait_until([&] { return session->on_poll_tick() == HostAction::Quit; }));
    EXPECT_TRUE(session->tabs().empty());
}

TEST_F(HostSessionTest, CloseWindowClosesTabsOneAtATime)
{
    auto session = make_session();
    session->start();
    session->on_new_tab_requested(0);
    session->on_new_tab_requested(0);
    std::vector<WindowId> windows = {make_ready(*session, 0), make_ready(*session, 1),
                                     make_ready(*session, 2)};
    fake_->close_kills_owner();

    EXPECT_EQ(session->on_window_close_requested(), HostAction::Repaint);
    EXPECT_EQ(fake_->close_requests(), (std::vector<WindowId>{windows[2]}));

    EXPECT_TRUE(wait_until([&] { return session->on_poll_tick() == HostAction::Quit; }));
    EXPECT_EQ(fake_->close_requests(),
              (std::vector<WindowId>{windows[2], windows[1], windows[0]}));
}

TEST_F(HostSessionTest, CloseWindowWithoutTabsQuits)
{
    auto session = make_session();
    EXPECT_EQ(session->on_window_close_requested(), HostAction::Quit);
}

TEST_F(HostSessionTest, CloseWindowBeforeAnyWindowAppearsQuits)
{
    auto session = make_session();
    session->start();
    session->on_new_tab_requested(0);
    EXPECT_EQ(session->on_window_close_requested(), HostAction::Quit);
}

TEST_F(HostSessionTest, DiscoveryTimeoutIsFatal)
{
    auto session = make_session(make_config(), DiscoveryOptions{std::chrono::milliseconds(1), 3});
    session->start();

    // The flag is raised before the event loop is woken.
    ASSERT_TRUE(wait_until([&] { return wakes_->load() > 0; }));
    EXPECT_TRUE(session->discovery_failed());
    EXPECT_TRUE(session->error_message().empty());
    EXPECT_EQ(session->on_poll_tick(), HostAction::Fatal);

    // Shown in the banner before the host exits.
    EXPECT_NE(session->error_message().find("sleep"), std::string::npos);
}

// ─── Host activation ─────────────────────────────────────────────────────────

TEST_F(HostSessionTest, HostActivationRaisesSelectedWindow)
{
    auto session = make_session();
    session->start();
    session->on_new_tab_requested(0);
    WindowId first  = make_ready(*session, 0);
    WindowId second = make_ready(*session, 1);
    session->on_poll_tick();

    const size_t raised_before = fake_->raised().size();
    EXPECT_EQ(session->on_host_activated(), HostAction::None);
    ASSERT_EQ(fake_->raised().size(), raised_before + 1);
    EXPECT_EQ(fake_->raised().back(), second);
    EXPECT_TRUE(fake_->visible(second));
    EXPECT_FALSE(fake_->visible(first));
}

TEST_F(HostSessionTest, HostActivationWithoutWindowDoesNothing)
{
    auto session = make_session();
    session->start();

    EXPECT_EQ(session->on_host_activated(), HostAction::None);
    EXPECT_TRUE(fake_->raised().empty());
}

// ─── Config & resize ─────────────────────────────────────────────────────────

TEST_F(HostSessionTest, ConfigReloadRenamesTabs)
{
    auto session = make_session();
    session->start();
    session->on_profile_hotkey(1);

    Config reloaded              = make_config();
    reloaded.profiles[1].name    = "Office";
    reloaded.profiles[1].title   = "%p";
    EXPECT_EQ(session->on_config_reloaded(reloaded), HostAction::Repaint);
    EXPECT_EQ(session->tabs().tab_label(1), "Office");
    EXPECT_EQ(session->config().profiles[1].name, "Office");
}

TEST_F(HostSessionTest, ConfigReloadAppliesToNewTabs)
{
    auto session = make_session();
    session->start();

    Config reloaded          = make_config();
    reloaded.content.command = "/nonexistent/tabhost-missing";
    session->on_config_reloaded(reloaded);

    session->on_new_tab_requested(0);
    EXPECT_EQ(session->tabs().count(), 1u);
    EXPECT_FALSE(session->error_message().empty());
}

TEST_F(HostSessionTest, ResizeRepositionsWindows)
{
    auto session = make_session();
    session->start();
    WindowId window = make_ready(*session, 0);

    EXPECT_EQ(session->on_resize(), HostAction::Repaint);
    EXPECT_EQ(fake_->window_rect(window), (Rect{4, 36, 340, 560}));
}

TEST(HostAction, Names)
{
    EXPECT_STREQ(host_action_to_string(HostAction::None), "none");
    EXPECT_STREQ(host_action_to_string(HostAction::Quit), "quit");
    EXPECT_STREQ(host_action_to_string(HostAction::Fatal), "fatal");
}

TEST_F(HostSessionTest, PollRetriesFailedMoves)
{
    auto session = make_session();
    session->start();
    WindowId window = make_ready(*session, 0);
    session->on_poll_tick();

    fake_->move_resize(window, Rect{0, 0, 10, 10});
    fake_->set_fail_moves(true);
    session->on_poll_tick();
    EXPECT_EQ(fake_->window_rect(window), (Rect{0, 0, 10, 10}));

    fake_->set_fail_moves(false);
    session->on_poll_tick();
    EXPECT_EQ(fake_->window_rect(window), (Rect{4, 36, 340, 560}));
}
