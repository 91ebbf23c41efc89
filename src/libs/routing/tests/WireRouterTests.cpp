// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "routing/WireRouter.hpp"

#include <QtCore/QSet>

using Routing::GridPath;
using Routing::PathResult;
using Routing::PathfinderConfig;
using Routing::Region;
using Routing::RegionList;
using Routing::WireRouter;

namespace {

PathfinderConfig boundedConfig(const QRect& bounds)
{
    PathfinderConfig cfg;
    cfg.searchBounds = bounds;
    return cfg;
}

bool crossesArea(const GridPath& path, const RegionList& cells)
{
    for (const auto& r : Routing::regionsForPath(path)) {
        for (int y = r.y; y < r.bottom(); ++y) {
            for (int x = r.x; x < r.right(); ++x) {
                if (Routing::containsPoint(cells, x, y))
                    return true;
            }
        }
    }
    return false;
}

// Every cell the path passes through, in order, corners counted once.
QVector<QPoint> cellsAlong(const GridPath& path)
{
    QVector<QPoint> cells;
    if (path.isEmpty())
        return cells;
    cells.push_back(path.front());
    for (qsizetype i = 1; i < path.size(); ++i) {
        const QPoint step((path[i].x() > path[i - 1].x()) - (path[i].x() < path[i - 1].x()),
                          (path[i].y() > path[i - 1].y()) - (path[i].y() < path[i - 1].y()));
        QPoint cur = path[i - 1];
        while (cur != path[i]) {
            cur += step;
            cells.push_back(cur);
        }
    }
    return cells;
}

} // namespace

TEST(WireRouterTests, RoutedWireBecomesObstacle)
{
    WireRouter router(boundedConfig(QRect(-1, -5, 13, 11)));

    const PathResult first = router.route(QPoint(0, 0), QPoint(10, 0));
    ASSERT_TRUE(first.isFound());
    ASSERT_EQ(router.wires().size(), 1);
    for (int x = 0; x <= 10; ++x)
        EXPECT_TRUE(router.obstacles().isOccupied(x, 0)) << x;

    // The second wire has to go around either end of the first.
    const PathResult second = router.route(QPoint(5, -2), QPoint(5, 2));
    ASSERT_TRUE(second.isFound());
    EXPECT_FALSE(crossesArea(second.path, Routing::regionsForPath(first.path)));
    EXPECT_EQ(router.wires().size(), 2);
}

TEST(WireRouterTests, CrossingIsImpossibleWhenWireSpansTheBounds)
{
    WireRouter router(boundedConfig(QRect(0, -5, 11, 11)));

    ASSERT_TRUE(router.route(QPoint(0, 0), QPoint(10, 0)).isFound());

    const PathResult blocked = router.route(QPoint(5, -2), QPoint(5, 2));
    EXPECT_EQ(blocked.status, PathResult::Status::NoPath);
    EXPECT_EQ(router.wires().size(), 1);
}

TEST(WireRouterTests, PortHolesStayOpenAfterWiring)
{
    WireRouter router(boundedConfig(QRect(-5, -5, 20, 20)));

    // A component body with a port cell on its top-left corner.
    router.addObstacle(RegionList{Region{2, 2, 4, 4}}, RegionList{Region{2, 2}});
    EXPECT_TRUE(router.obstacles().isOccupied(3, 3));
    EXPECT_FALSE(router.obstacles().isOccupied(2, 2));

    const PathResult first = router.route(QPoint(-2, 2), QPoint(2, 2));
    ASSERT_TRUE(first.isFound());
    EXPECT_EQ(first.path, (GridPath{{-2, 2}, {2, 2}}));

    EXPECT_FALSE(router.obstacles().isOccupied(2, 2));
    EXPECT_TRUE(router.obstacles().isOccupied(0, 2));

    // A second wire can still leave the same port.
    const PathResult second = router.route(QPoint(2, 2), QPoint(2, -3));
    ASSERT_TRUE(second.isFound()) << Routing::statusName(second.status);
    EXPECT_EQ(second.path, (GridPath{{2, 2}, {2, -3}}));
}

TEST(WireRouterTests, PreviewDoesNotCommit)
{
    WireRouter router;
    const PathResult preview = router.previewRoute(QPoint(0, 0), QPoint(4, 4));
    ASSERT_TRUE(preview.isFound());
    EXPECT_TRUE(router.wires().isEmpty());
    EXPECT_TRUE(router.obstacles().isEmpty());

    const PathResult committed = router.route(QPoint(0, 0), QPoint(4, 4));
    EXPECT_EQ(committed.path, preview.path);
    EXPECT_FALSE(router.obstacles().isEmpty());
}

TEST(WireRouterTests, RoutesThroughWaypoints)
{
    WireRouter router;
    const PathResult result = router.routeViaWaypoints({QPoint(0, 0), QPoint(5, 0), QPoint(5, 5)});

    ASSERT_TRUE(result.isFound());
    EXPECT_EQ(result.path, (GridPath{{0, 0}, {5, 0}, {5, 5}}));
    EXPECT_EQ(result.cost, 10 + 2);
    ASSERT_EQ(router.wires().size(), 1);
    EXPECT_TRUE(router.obstacles().isOccupied(5, 3));
}

TEST(WireRouterTests, LaterLegsAvoidEarlierLegsOfTheSameWire)
{
    WireRouter router;

    // Straight back to the west would retrace the first leg.
    const PathResult result = router.routeViaWaypoints({QPoint(0, 0), QPoint(6, 0), QPoint(-3, 0)});
    ASSERT_TRUE(result.isFound()) << Routing::statusName(result.status);
    EXPECT_EQ(result.path.front(), QPoint(0, 0));
    EXPECT_EQ(result.path.back(), QPoint(-3, 0));

    const QVector<QPoint> cells = cellsAlong(result.path);
    QSet<QPoint> seen;
    for (const QPoint& c : cells) {
        EXPECT_FALSE(seen.contains(c)) << "cell (" << c.x() << ", " << c.y() << ") visited twice";
        seen.insert(c);
    }
    EXPECT_TRUE(seen.contains(QPoint(6, 0)));
    EXPECT_EQ(Routing::pathCost(result.path, 1, 2), result.cost);
}

TEST(WireRouterTests, WaypointOnEarlierLegIsBlocked)
{
    WireRouter router;

    const PathResult result = router.routeViaWaypoints({QPoint(0, 0), QPoint(6, 0), QPoint(3, 0)});
    EXPECT_EQ(result.status, PathResult::Status::EndpointBlocked);
    EXPECT_TRUE(router.wires().isEmpty());
    EXPECT_TRUE(router.obstacles().isEmpty());
}

TEST(WireRouterTests, FailedWaypointLegCommitsNothing)
{
    WireRouter router;
    router.addObstacle(Routing::Area(RegionList{Region{8, 8}}));

    const PathResult result = router.routeViaWaypoints({QPoint(0, 0), QPoint(4, 0), QPoint(8, 8)});
    EXPECT_EQ(result.status, PathResult::Status::EndpointBlocked);
    EXPECT_TRUE(router.wires().isEmpty());
    EXPECT_FALSE(router.obstacles().isOccupied(2, 0));
}

TEST(WireRouterTests, ClearDropsObstaclesAndWires)
{
    WireRouter router;
    router.addObstacle(RegionList{Region{0, 0, 3, 3}});
    ASSERT_TRUE(router.route(QPoint(5, 0), QPoint(5, 5)).isFound());

    router.clear();
    EXPECT_TRUE(router.obstacles().isEmpty());
    EXPECT_TRUE(router.wires().isEmpty());
    EXPECT_TRUE(router.route(QPoint(1, 1), QPoint(5, 5)).isFound());
}
