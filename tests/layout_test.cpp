/*
 * SelfieLight - Tests for light layouts and style names
 * License: MIT
 */

#include "layout.h"

#include <gtest/gtest.h>

namespace {

const QRect kWorkArea(0, 0, 1920, 1040);

} // namespace

TEST(Layout, SideBarsTakeFifteenPercentEach) {
    auto specs = Layout::surfacesFor(Style::Sides, kWorkArea, 100, QRect());
    ASSERT_EQ(specs.size(), 2);
    EXPECT_EQ(specs[0].role, Role::Left);
    EXPECT_EQ(specs[0].geometry, QRect(0, 0, 288, 1040));
    EXPECT_EQ(specs[1].role, Role::Right);
    EXPECT_EQ(specs[1].geometry, QRect(1632, 0, 288, 1040));
}

TEST(Layout, FollowsWorkAreaOrigin) {
    // Panel on the left of a second monitor
    QRect work(1968, 0, 1872, 1080);
    auto specs = Layout::surfacesFor(Style::Sides, work, 100, QRect());
    ASSERT_EQ(specs.size(), 2);
    EXPECT_EQ(specs[0].geometry.left(), 1968);
    EXPECT_EQ(specs[1].geometry.right(), work.right());
}

TEST(Layout, BorderHasFourBarsOfSharedThickness) {
    auto specs = Layout::surfacesFor(Style::Border, kWorkArea, 60, QRect());
    ASSERT_EQ(specs.size(), 4);
    for (const SurfaceSpec &s : specs) {
        EXPECT_EQ(s.role, Role::Border);
        EXPECT_EQ(qMin(s.geometry.width(), s.geometry.height()), 60);
    }
    EXPECT_EQ(specs[0].geometry, QRect(0, 0, 1920, 60));
    EXPECT_EQ(specs[1].geometry, QRect(0, 980, 1920, 60));
    EXPECT_EQ(specs[2].geometry, QRect(0, 0, 60, 1040));
    EXPECT_EQ(specs[3].geometry, QRect(1860, 0, 60, 1040));
}

TEST(Layout, BorderNeverThinnerThanMinimum) {
    auto specs = Layout::surfacesFor(Style::Border, kWorkArea, 5, QRect());
    ASSERT_EQ(specs.size(), 4);
    EXPECT_EQ(specs[0].geometry.height(), Layout::MinBarSize);
}

TEST(Layout, TopBarSpansWidth) {
    auto specs = Layout::surfacesFor(Style::Top, kWorkArea, 100, QRect());
    ASSERT_EQ(specs.size(), 1);
    EXPECT_EQ(specs[0].role, Role::Top);
    EXPECT_EQ(specs[0].geometry, QRect(0, 0, 1920, 156));
}

TEST(Layout, FullscreenCoversWorkArea) {
    auto specs = Layout::surfacesFor(Style::Fullscreen, kWorkArea, 100, QRect());
    ASSERT_EQ(specs.size(), 1);
    EXPECT_EQ(specs[0].role, Role::Fullscreen);
    EXPECT_EQ(specs[0].geometry, kWorkArea);
}

TEST(Layout, RingUsesGivenGeometry) {
    auto specs = Layout::surfacesFor(Style::Ring, kWorkArea, 100, QRect(100, 100, 400, 400));
    ASSERT_EQ(specs.size(), 1);
    EXPECT_EQ(specs[0].role, Role::Ring);
    EXPECT_EQ(specs[0].geometry, QRect(100, 100, 400, 400));
}

TEST(Layout, RingIsNeverSmallerThanMinimum) {
    auto specs = Layout::surfacesFor(Style::Ring, kWorkArea, 100, QRect(10, 20, 30, 30));
    ASSERT_EQ(specs.size(), 1);
    EXPECT_EQ(specs[0].geometry, QRect(10, 20, Layout::MinRingSize, Layout::MinRingSize));
}

TEST(Layout, CenteredRing) {
    EXPECT_EQ(Layout::centeredRing(kWorkArea, 400), QRect(760, 320, 400, 400));
}

TEST(Style, NamesRoundTrip) {
    for (Style s : {Style::Sides, Style::Border, Style::Top, Style::Fullscreen, Style::Ring}) {
        Style parsed = Style::Sides;
        ASSERT_TRUE(parseStyle(styleName(s), &parsed));
        EXPECT_EQ(parsed, s);
    }
}

TEST(Style, ParsingIsCaseInsensitive) {
    Style s = Style::Sides;
    EXPECT_TRUE(parseStyle(QStringLiteral(" Ring "), &s));
    EXPECT_EQ(s, Style::Ring);
}

TEST(Style, UnknownNameFallsBackToSides) {
    Style s = Style::Top;
    EXPECT_FALSE(parseStyle(QStringLiteral("hexagon"), &s));
    EXPECT_EQ(s, Style::Top);
    EXPECT_EQ(styleFromName(QStringLiteral("hexagon")), Style::Sides);
    EXPECT_EQ(styleFromName(QString()), Style::Sides);
}
