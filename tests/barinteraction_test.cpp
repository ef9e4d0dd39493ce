/*
 * SelfieLight - Tests for light bar drag and resize
 * License: MIT
 */

#include "barinteraction.h"
#include "layout.h"

#include <gtest/gtest.h>

using Edge = BarInteraction::Edge;
using State = BarInteraction::State;

namespace {

const QRect kBar(100, 50, 200, 400);

// Press at a window local position of kBar
void pressAt(BarInteraction &bar, const QPoint &local) {
    bar.press(local, kBar.topLeft() + local, kBar);
}

} // namespace

TEST(BarInteraction, EdgeDetection) {
    const QSize size = kBar.size();
    EXPECT_EQ(BarInteraction::edgeAt(QPoint(0, 200), size), Edge::Left);
    EXPECT_EQ(BarInteraction::edgeAt(QPoint(9, 200), size), Edge::Left);
    EXPECT_EQ(BarInteraction::edgeAt(QPoint(10, 200), size), Edge::None);
    EXPECT_EQ(BarInteraction::edgeAt(QPoint(190, 200), size), Edge::Right);
    EXPECT_EQ(BarInteraction::edgeAt(QPoint(100, 5), size), Edge::Top);
    EXPECT_EQ(BarInteraction::edgeAt(QPoint(100, 395), size), Edge::Bottom);
    EXPECT_EQ(BarInteraction::edgeAt(QPoint(100, 200), size), Edge::None);
}

TEST(BarInteraction, CornersPreferHorizontalEdges) {
    EXPECT_EQ(BarInteraction::edgeAt(QPoint(2, 2), kBar.size()), Edge::Left);
    EXPECT_EQ(BarInteraction::edgeAt(QPoint(198, 398), kBar.size()), Edge::Right);
}

TEST(BarInteraction, CursorFeedback) {
    EXPECT_EQ(BarInteraction::cursorFor(Edge::Left), Qt::SizeHorCursor);
    EXPECT_EQ(BarInteraction::cursorFor(Edge::Right), Qt::SizeHorCursor);
    EXPECT_EQ(BarInteraction::cursorFor(Edge::Top), Qt::SizeVerCursor);
    EXPECT_EQ(BarInteraction::cursorFor(Edge::Bottom), Qt::SizeVerCursor);
    EXPECT_EQ(BarInteraction::cursorFor(Edge::None), Qt::ArrowCursor);
}

TEST(BarInteraction, IdleDragDoesNothing) {
    BarInteraction bar;
    QRect geometry = kBar;
    EXPECT_FALSE(bar.drag(QPoint(500, 500), &geometry));
    EXPECT_EQ(geometry, kBar);
    EXPECT_EQ(bar.state(), State::Idle);
}

TEST(BarInteraction, PressInsideMoves) {
    BarInteraction bar;
    pressAt(bar, QPoint(100, 200));
    EXPECT_EQ(bar.state(), State::Moving);

    QRect geometry;
    ASSERT_TRUE(bar.drag(QPoint(230, 270), &geometry));
    EXPECT_EQ(geometry, QRect(130, 70, 200, 400));

    bar.release();
    EXPECT_EQ(bar.state(), State::Idle);
    EXPECT_FALSE(bar.drag(QPoint(0, 0), &geometry));
}

TEST(BarInteraction, ResizeLeftKeepsRightEdge) {
    BarInteraction bar;
    pressAt(bar, QPoint(2, 200));
    ASSERT_EQ(bar.state(), State::Resizing);
    ASSERT_EQ(bar.edge(), Edge::Left);

    QRect geometry;
    ASSERT_TRUE(bar.drag(QPoint(102 - 50, 250), &geometry));
    EXPECT_EQ(geometry.width(), 250);
    EXPECT_EQ(geometry.height(), 400);
    EXPECT_EQ(geometry.right(), kBar.right());
    EXPECT_EQ(geometry.top(), kBar.top());
}

TEST(BarInteraction, ResizeRightKeepsLeftEdge) {
    BarInteraction bar;
    pressAt(bar, QPoint(195, 200));
    ASSERT_EQ(bar.edge(), Edge::Right);

    QRect geometry;
    ASSERT_TRUE(bar.drag(QPoint(295 - 80, 250), &geometry));
    EXPECT_EQ(geometry, QRect(100, 50, 120, 400));
}

TEST(BarInteraction, ResizeTopKeepsBottomEdge) {
    BarInteraction bar;
    pressAt(bar, QPoint(100, 3));
    ASSERT_EQ(bar.edge(), Edge::Top);

    QRect geometry;
    ASSERT_TRUE(bar.drag(QPoint(200, 53 + 100), &geometry));
    EXPECT_EQ(geometry.height(), 300);
    EXPECT_EQ(geometry.bottom(), kBar.bottom());
    EXPECT_EQ(geometry.width(), 200);
}

TEST(BarInteraction, ResizeBottomKeepsTopEdge) {
    BarInteraction bar;
    pressAt(bar, QPoint(100, 398));
    ASSERT_EQ(bar.edge(), Edge::Bottom);

    QRect geometry;
    ASSERT_TRUE(bar.drag(QPoint(200, 448 + 40), &geometry));
    EXPECT_EQ(geometry, QRect(100, 50, 200, 440));
}

TEST(BarInteraction, ResizeBelowMinimumIsRejected) {
    BarInteraction bar;
    pressAt(bar, QPoint(195, 200));

    QRect geometry = kBar;
    // 200 wide bar dragged to 15 px
    EXPECT_FALSE(bar.drag(QPoint(295 - 185, 250), &geometry));
    EXPECT_EQ(geometry, kBar);

    // Exactly the minimum is fine
    ASSERT_TRUE(bar.drag(QPoint(295 - 180, 250), &geometry));
    EXPECT_EQ(geometry.width(), Layout::MinBarSize);
}

TEST(BarInteraction, RejectedStepKeepsLastAcceptedGeometry) {
    BarInteraction bar;
    pressAt(bar, QPoint(2, 200));

    QRect geometry;
    ASSERT_TRUE(bar.drag(QPoint(152, 200), &geometry));
    EXPECT_EQ(geometry.width(), 150);

    QRect unchanged = geometry;
    EXPECT_FALSE(bar.drag(QPoint(300, 200), &unchanged));
    EXPECT_EQ(unchanged, geometry);

    // Recovers on the next valid position, measured from the press
    ASSERT_TRUE(bar.drag(QPoint(202, 200), &geometry));
    EXPECT_EQ(geometry.width(), 100);
    EXPECT_EQ(geometry.right(), kBar.right());
}

TEST(BarInteraction, SamePositionReportsNoChange) {
    BarInteraction bar;
    pressAt(bar, QPoint(100, 200));
    QRect geometry;
    EXPECT_FALSE(bar.drag(kBar.topLeft() + QPoint(100, 200), &geometry));
}
