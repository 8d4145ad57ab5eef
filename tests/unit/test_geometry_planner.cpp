#include <gtest/gtest.h>

#include "core/geometry_planner.hpp"
#include "core/shared_cell.hpp"

using namespace tabhost;

// ─── plan_content_rect ───────────────────────────────────────────────────────

TEST(GeometryPlanner, OffsetsByTitlebarAndInset)
{
    Rect target = plan_content_rect(Rect{100, 50, 1200, 800}, 32, 4);
    EXPECT_EQ(target, (Rect{104, 86, 1192, 760}));
}

TEST(GeometryPlanner, ZeroInset)
{
    Rect target = plan_content_rect(Rect{0, 0, 800, 600}, 32, 0);
    EXPECT_EQ(target, (Rect{0, 32, 800, 568}));
}

TEST(GeometryPlanner, TinyHostClampsToOnePixel)
{
    Rect target = plan_content_rect(Rect{10, 10, 4, 20}, 32, 4);
    EXPECT_EQ(target.x, 14);
    EXPECT_EQ(target.y, 46);
    EXPECT_EQ(target.width, 1);
    EXPECT_EQ(target.height, 1);
}

TEST(GeometryPlanner, HostGeometryOverload)
{
    HostGeometry geometry{Rect{20, 30, 640, 480}, 32, 4};
    EXPECT_EQ(plan_content_rect(geometry), plan_content_rect(geometry.client_rect, 32, 4));
}

TEST(GeometryPlanner, NegativeOriginOnSecondaryMonitor)
{
    Rect target = plan_content_rect(Rect{-1920, 0, 1920, 1080}, 32, 4);
    EXPECT_EQ(target, (Rect{-1916, 36, 1912, 1040}));
}

// ─── Rect ────────────────────────────────────────────────────────────────────

TEST(Rect, ContainsIsHalfOpen)
{
    Rect r{10, 10, 20, 20};
    EXPECT_TRUE(r.contains(10, 10));
    EXPECT_TRUE(r.contains(29, 29));
    EXPECT_FALSE(r.contains(30, 15));
    EXPECT_FALSE(r.contains(15, 30));
    EXPECT_FALSE(r.contains(9, 15));
}

TEST(Rect, ToString)
{
    EXPECT_EQ((Rect{1, 2, 3, 4}).to_string(), "(1, 2) 3x4");
}

// ─── SharedCell ──────────────────────────────────────────────────────────────

TEST(SharedCell, SetGetUpdate)
{
    auto cell = make_shared_cell(HostGeometry{});
    cell->set(HostGeometry{Rect{0, 0, 10, 10}, 32, 4});
    cell->update([](HostGeometry& g) { g.inset = 8; });

    HostGeometry g = cell->get();
    EXPECT_EQ(g.client_rect, (Rect{0, 0, 10, 10}));
    EXPECT_EQ(g.titlebar_height, 32);
    EXPECT_EQ(g.inset, 8);
}
