// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "routing/WireRouter.hpp"

#include "routing/Occupancy.hpp"

#include <QtCore/QDebug>

#include <utility>

namespace Routing {

namespace {

// Obstacles plus the legs already routed for the current wire. The leg's
// start cell is where the previous leg ended, so it stays passable.
class LegOccupancy final : public Api::IOccupancySource
{
public:
    LegOccupancy(const Area& obstacles, const Area& earlierLegs, const QPoint& legStart)
        : m_obstacles(obstacles)
        , m_earlierLegs(earlierLegs)
        , m_legStart(legStart)
    {}

    bool isOccupied(int x, int y) const override
    {
        if (m_obstacles.isOccupied(x, y))
            return true;
        if (x == m_legStart.x() && y == m_legStart.y())
            return false;
        return m_earlierLegs.isOccupied(x, y);
    }

private:
    const Area& m_obstacles;
    const Area& m_earlierLegs;
    QPoint m_legStart;
};

} // namespace

WireRouter::WireRouter(PathfinderConfig config)
    : m_config(std::move(config))
{}

void WireRouter::addObstacle(const Area& area)
{
    m_obstacles = Area::united(m_obstacles, area);
}

void WireRouter::addObstacle(const RegionList& solid, const RegionList& keepClear)
{
    Area area(solid);
    area.subtract(keepClear);
    addObstacle(area);
}

void WireRouter::clear()
{
    m_obstacles = Area();
    m_wires.clear();
}

PathResult WireRouter::previewRoute(const QPoint& start, const QPoint& end) const
{
    return previewRoute(start, end, m_config.defaultTurnPenalty());
}

PathResult WireRouter::previewRoute(const QPoint& start, const QPoint& end, int turnPenalty) const
{
    const AreaOccupancy occupancy(m_obstacles);
    const Pathfinder finder(occupancy, m_config);
    return finder.findPath(start, end, turnPenalty);
}

PathResult WireRouter::route(const QPoint& start, const QPoint& end)
{
    return route(start, end, m_config.defaultTurnPenalty());
}

PathResult WireRouter::route(const QPoint& start, const QPoint& end, int turnPenalty)
{
    PathResult result = previewRoute(start, end, turnPenalty);
    if (!result) {
        qCDebug(routinglog) << "WireRouter: route" << start << "->" << end
                            << "failed:" << statusName(result.status);
        return result;
    }

    commit(result.path);
    return result;
}

PathResult WireRouter::routeViaWaypoints(const QVector<QPoint>& waypoints)
{
    return routeViaWaypoints(waypoints, m_config.defaultTurnPenalty());
}

PathResult WireRouter::routeViaWaypoints(const QVector<QPoint>& waypoints, int turnPenalty)
{
    if (waypoints.isEmpty())
        return PathResult{};
    if (waypoints.size() == 1)
        return route(waypoints.front(), waypoints.front(), turnPenalty);

    GridPath combined;
    Area earlierLegs;
    int explored = 0;
    for (qsizetype i = 1; i < waypoints.size(); ++i) {
        const LegOccupancy occupancy(m_obstacles, earlierLegs, waypoints[i - 1]);
        const Pathfinder finder(occupancy, m_config);
        PathResult leg = finder.findPath(waypoints[i - 1], waypoints[i], turnPenalty);
        explored += leg.exploredNodes;
        if (!leg) {
            qCDebug(routinglog) << "WireRouter: leg" << i << "of" << (waypoints.size() - 1)
                                << "failed:" << statusName(leg.status);
            leg.exploredNodes = explored;
            return leg;
        }

        earlierLegs.add(regionsForPath(leg.path));
        if (combined.isEmpty())
            combined = std::move(leg.path);
        else
            combined.append(leg.path.mid(1));
    }

    PathResult result;
    result.status = PathResult::Status::Found;
    result.path = simplifyPath(combined);
    result.cost = pathCost(result.path, m_config.stepCost, qMax(0, turnPenalty));
    result.exploredNodes = explored;

    commit(result.path);
    return result;
}

void WireRouter::commit(const GridPath& path)
{
    addObstacle(Area(regionsForPath(path)));
    m_wires.push_back(path);
}

} // namespace Routing
