// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "routing/GridPath.hpp"
#include "routing/Region.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QVector>

#include <algorithm>
#include <cmath>

// Conversions between grid cells and scene units (pixels). Cell (x, y) spans
// [x * cellSize, (x + 1) * cellSize) on each axis.
namespace Routing::Support {

inline double effectiveCellSize(double cellSize)
{
    return cellSize > 0.0 ? cellSize : 1.0;
}

inline double toPixel(int gridUnit, double cellSize)
{
    return gridUnit * effectiveCellSize(cellSize);
}

inline double toPixelCenter(int gridUnit, double cellSize)
{
    const double step = effectiveCellSize(cellSize);
    return gridUnit * step + step / 2.0;
}

inline QPointF toPixelCenter(const QPoint& cell, double cellSize)
{
    return QPointF(toPixelCenter(cell.x(), cellSize), toPixelCenter(cell.y(), cellSize));
}

inline int toGridCoord(double pixel, double cellSize)
{
    return static_cast<int>(std::floor(pixel / effectiveCellSize(cellSize)));
}

inline QPoint toGridPoint(const QPointF& scene, double cellSize)
{
    return QPoint(toGridCoord(scene.x(), cellSize), toGridCoord(scene.y(), cellSize));
}

// Wires are drawn through cell centers.
inline QVector<QPointF> toPixelPolyline(const GridPath& path, double cellSize)
{
    QVector<QPointF> out;
    out.reserve(path.size());
    for (const auto& p : path)
        out.push_back(toPixelCenter(p, cellSize));
    return out;
}

// Smallest block of cells touching the scene rectangle.
inline Region regionForSceneRect(const QRectF& rect, double cellSize)
{
    const QRectF r = rect.normalized();
    const double step = effectiveCellSize(cellSize);
    const int left = static_cast<int>(std::floor(r.left() / step));
    const int top = static_cast<int>(std::floor(r.top() / step));
    const int right = std::max(left + 1, static_cast<int>(std::ceil(r.right() / step)));
    const int bottom = std::max(top + 1, static_cast<int>(std::ceil(r.bottom() / step)));
    return Region{left, top, right - left, bottom - top};
}

} // namespace Routing::Support
