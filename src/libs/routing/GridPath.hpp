// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "routing/RoutingGlobal.hpp"
#include "routing/Region.hpp"

#include <QtCore/QPoint>
#include <QtCore/QVector>

namespace Routing {

// Ordered grid waypoints. Consecutive points of a routed path share an axis.
using GridPath = QVector<QPoint>;

// Drops every interior point whose incoming and outgoing directions match.
ROUTING_EXPORT GridPath simplifyPath(const GridPath& path);

// Number of unit steps along an orthogonal path.
ROUTING_EXPORT int pathLength(const GridPath& path);

// Direction changes along the path, whether or not it was simplified.
ROUTING_EXPORT int turnCount(const GridPath& path);

// Cost under the pathfinder's model: stepCost per unit step plus
// turnPenalty per direction change.
ROUTING_EXPORT qint64 pathCost(const GridPath& path, int stepCost, int turnPenalty);

ROUTING_EXPORT bool isOrthogonal(const GridPath& path);

// Cells covered by the path, endpoints included, one region per segment.
// A pair that does not share an axis is covered x-first, then y.
ROUTING_EXPORT RegionList regionsForPath(const GridPath& path);

} // namespace Routing
