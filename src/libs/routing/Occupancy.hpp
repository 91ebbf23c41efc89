// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "routing/RoutingGlobal.hpp"
#include "routing/Area.hpp"
#include "routing/Region.hpp"
#include "routing/api/IOccupancySource.hpp"

#include <QtCore/QPoint>
#include <QtCore/QRect>
#include <QtCore/QSet>

#include <utility>

namespace Routing {

// Rectangle-backed source. The area must outlive the adapter.
class ROUTING_EXPORT AreaOccupancy final : public Api::IOccupancySource
{
public:
    explicit AreaOccupancy(const Area& area) : m_area(area) {}

    bool isOccupied(int x, int y) const override { return m_area.isOccupied(x, y); }

    const Area& area() const { return m_area; }

private:
    const Area& m_area;
};

// Per-cell source for callers that already work with rasterized obstacles.
class ROUTING_EXPORT CellSetOccupancy final : public Api::IOccupancySource
{
public:
    CellSetOccupancy() = default;
    explicit CellSetOccupancy(QSet<QPoint> cells) : m_cells(std::move(cells)) {}

    static CellSetOccupancy fromRegions(const RegionList& regions);

    // Samples area.isOccupied over every cell of window. Cells outside the
    // window are reported free.
    static CellSetOccupancy rasterize(const Area& area, const QRect& window);

    bool isOccupied(int x, int y) const override { return m_cells.contains(QPoint(x, y)); }

    void insert(const QPoint& cell) { m_cells.insert(cell); }
    void remove(const QPoint& cell) { m_cells.remove(cell); }
    bool contains(const QPoint& cell) const { return m_cells.contains(cell); }
    qsizetype size() const { return m_cells.size(); }

    const QSet<QPoint>& cells() const { return m_cells; }

private:
    QSet<QPoint> m_cells;
};

} // namespace Routing
