// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "routing/RoutingGlobal.hpp"
#include "routing/Region.hpp"

#include <QtCore/QPoint>
#include <QtCore/QRect>

namespace Routing {

// An occupancy map built from two region channels. A cell is occupied when a
// positive region covers it and no negative region (hole) does, so a 5x5
// square minus its 3x3 center is a ring.
//
// Each channel is kept as the sweep-line merge of everything ever added to
// it: regions never overlap and merging a channel again changes nothing.
// Channels only grow; there is no removal.
class ROUTING_EXPORT Area final
{
public:
    Area() = default;
    explicit Area(const RegionList& initial);

    Area& add(const RegionList& regions);
    Area& subtract(const RegionList& regions);

    bool isOccupied(int x, int y) const;
    bool isOccupied(const QPoint& cell) const { return isOccupied(cell.x(), cell.y()); }

    const RegionList& positiveRegions() const { return m_positive; }
    const RegionList& negativeRegions() const { return m_negative; }

    bool isEmpty() const { return m_positive.isEmpty(); }

    // Bounding rectangle of the positive channel, null when empty.
    QRect boundingRect() const;

    // Combines the channels independently: positive with positive, holes
    // with holes. A hole from one operand also cuts through the other's
    // coverage.
    static Area united(const Area& a, const Area& b);

    // Vertical-strip sweep. Output is ordered by strip left to right, then
    // top to bottom within a strip.
    static RegionList mergeRegions(const RegionList& regions);

private:
    RegionList m_positive;
    RegionList m_negative;
};

} // namespace Routing
