#include <gtest/gtest.h>

#include <memory>

#include "util/fake_window_system.hpp"
#include "window/window_locator.hpp"

using namespace tabhost;
using tabhost::test::FakeWindowSystem;

class WindowLocatorTest : public ::testing::Test
{
   protected:
    std::shared_ptr<FakeWindowSystem> fake_ = std::make_shared<FakeWindowSystem>();
};

// ─── WindowMatch ─────────────────────────────────────────────────────────────

TEST(WindowMatch, ExactTitleAndClass)
{
    auto       pred = WindowMatch{}.predicate();
    WindowInfo info;
    info.title        = "Neovide";
    info.window_class = "neovide";
    EXPECT_TRUE(pred(info));

    info.title = "Neovide - main.cpp";
    EXPECT_FALSE(pred(info));

    info.title        = "Neovide";
    info.window_class = "Neovide";
    EXPECT_FALSE(pred(info));
}

TEST(WindowMatch, EmptyFieldMatchesAnything)
{
    auto       pred = WindowMatch{"", "kitty"}.predicate();
    WindowInfo info;
    info.title        = "whatever";
    info.window_class = "kitty";
    EXPECT_TRUE(pred(info));
}

// ─── find ────────────────────────────────────────────────────────────────────

TEST_F(WindowLocatorTest, FindsWindowOfPid)
{
    fake_->add_window(100, "Neovide", "neovide");
    WindowId want = fake_->add_window(200, "Neovide", "neovide");

    WindowLocator locator(fake_, WindowMatch{}.predicate());
    auto          found = locator.find(200);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, want);
    EXPECT_EQ(found->pid, 200);
}

TEST_F(WindowLocatorTest, SkipsWindowsRejectedByPredicate)
{
    fake_->add_window(200, "Splash", "neovide");
    WindowId want = fake_->add_window(200, "Neovide", "neovide");

    WindowLocator locator(fake_, WindowMatch{}.predicate());
    auto          found = locator.find(200);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, want);
}

TEST_F(WindowLocatorTest, FirstMatchWinsAndStopsEnumeration)
{
    WindowId first = fake_->add_window(200, "Neovide", "neovide");
    fake_->add_window(200, "Neovide", "neovide");

    int           calls = 0;
    WindowLocator locator(fake_,
                          [&calls](const WindowInfo& info)
                          {
                              ++calls;
                              return info.title == "Neovide";
                          });
    auto found = locator.find(200);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, first);
    EXPECT_EQ(calls, 1);
}

TEST_F(WindowLocatorTest, NoMatch)
{
    fake_->add_window(200, "Terminal", "xterm");
    WindowLocator locator(fake_, WindowMatch{}.predicate());
    EXPECT_FALSE(locator.find(200).has_value());
    EXPECT_FALSE(locator.find(0).has_value());
}

TEST_F(WindowLocatorTest, NullPredicateMatchesByPidOnly)
{
    WindowId want = fake_->add_window(300, "Terminal", "xterm");
    WindowLocator locator(fake_, nullptr);
    auto          found = locator.find(300);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, want);
}

TEST_F(WindowLocatorTest, OnePassPerFind)
{
    WindowLocator locator(fake_, WindowMatch{}.predicate());
    locator.find(1);
    locator.find(2);
    EXPECT_EQ(fake_->enumeration_count(), 2);
}

// ─── list_matching ───────────────────────────────────────────────────────────

TEST_F(WindowLocatorTest, ListMatchingIgnoresCase)
{
    fake_->add_window(1, "Neovide", "neovide");
    fake_->add_window(2, "notes - NEOVIDE", "other");
    fake_->add_window(3, "Firefox", "firefox");

    WindowLocator locator(fake_, nullptr);
    EXPECT_EQ(locator.list_matching("neovide").size(), 2u);
    EXPECT_EQ(locator.list_matching("FIRE").size(), 1u);
    EXPECT_EQ(locator.list_matching("").size(), 3u);
    EXPECT_TRUE(locator.list_matching("emacs").empty());
}
