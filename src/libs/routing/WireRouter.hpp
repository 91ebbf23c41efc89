// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "routing/RoutingGlobal.hpp"
#include "routing/Area.hpp"
#include "routing/GridPath.hpp"
#include "routing/Pathfinder.hpp"
#include "routing/PathfinderConfig.hpp"

#include <QtCore/QPoint>
#include <QtCore/QVector>

namespace Routing {

// Routes wires one after another over a shared obstacle map. Every wire that
// is routed successfully is merged into the obstacles, so later wires go
// around it. Holes (for example a component's port cells) stay open even
// after a wire ends on them.
class ROUTING_EXPORT WireRouter final
{
public:
    explicit WireRouter(PathfinderConfig config = {});

    const PathfinderConfig& config() const { return m_config; }
    void setConfig(const PathfinderConfig& config) { m_config = config; }

    const Area& obstacles() const { return m_obstacles; }
    const QVector<GridPath>& wires() const { return m_wires; }

    void addObstacle(const Area& area);
    void addObstacle(const RegionList& solid, const RegionList& keepClear = {});

    void clear();

    PathResult previewRoute(const QPoint& start, const QPoint& end) const;
    PathResult previewRoute(const QPoint& start, const QPoint& end, int turnPenalty) const;

    PathResult route(const QPoint& start, const QPoint& end);
    PathResult route(const QPoint& start, const QPoint& end, int turnPenalty);

    // Legs are routed in order and the combined wire is committed only when
    // all of them succeed. Otherwise the failing leg's status is returned.
    // A later leg may not run over an earlier leg of the same wire. Only the
    // shared waypoint is passable, so a waypoint that lies on an earlier leg
    // reports EndpointBlocked.
    PathResult routeViaWaypoints(const QVector<QPoint>& waypoints);
    PathResult routeViaWaypoints(const QVector<QPoint>& waypoints, int turnPenalty);

private:
    void commit(const GridPath& path);

    PathfinderConfig m_config;
    Area m_obstacles;
    QVector<GridPath> m_wires;
};

} // namespace Routing
