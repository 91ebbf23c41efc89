// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "routing/Occupancy.hpp"

namespace Routing {

CellSetOccupancy CellSetOccupancy::fromRegions(const RegionList& regions)
{
    CellSetOccupancy out;
    for (const auto& r : regions) {
        for (int y = r.y; y < r.bottom(); ++y) {
            for (int x = r.x; x < r.right(); ++x)
                out.insert(QPoint(x, y));
        }
    }
    return out;
}

CellSetOccupancy CellSetOccupancy::rasterize(const Area& area, const QRect& window)
{
    CellSetOccupancy out;
    if (window.isEmpty())
        return out;

    for (int y = window.top(); y <= window.bottom(); ++y) {
        for (int x = window.left(); x <= window.right(); ++x) {
            if (area.isOccupied(x, y))
                out.insert(QPoint(x, y));
        }
    }
    return out;
}

} // namespace Routing
