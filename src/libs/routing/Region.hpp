// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "routing/RoutingGlobal.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QRect>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

QT_BEGIN_NAMESPACE
class QDebug;
QT_END_NAMESPACE

namespace Routing {

// Axis-aligned block of grid cells. (x, y) is the top-left cell, dx/dy the
// width and height in cells. dx/dy >= 1 is the caller's responsibility.
struct ROUTING_EXPORT Region final {
    int x = 0;
    int y = 0;
    int dx = 1;
    int dy = 1;

    // Exclusive edges.
    int right() const { return x + dx; }
    int bottom() const { return y + dy; }

    bool isValid() const { return dx > 0 && dy > 0; }

    bool contains(int px, int py) const
    {
        return px >= x && px < x + dx && py >= y && py < y + dy;
    }

    bool intersects(const Region& other) const
    {
        return x < other.right() && other.x < right()
            && y < other.bottom() && other.y < bottom();
    }

    QRect toRect() const { return QRect(x, y, dx, dy); }
    static Region fromRect(const QRect& rect);

    // Interchange shape {x, y, dx?, dy?}; dx/dy are written only when != 1.
    QJsonObject toJson() const;
    static std::optional<Region> fromJson(const QJsonObject& object, QString* error = nullptr);

    friend bool operator==(const Region& a, const Region& b)
    {
        return a.x == b.x && a.y == b.y && a.dx == b.dx && a.dy == b.dy;
    }
    friend bool operator!=(const Region& a, const Region& b) { return !(a == b); }
};

using RegionList = QVector<Region>;

ROUTING_EXPORT bool containsPoint(const RegionList& regions, int x, int y);

ROUTING_EXPORT QJsonArray regionsToJson(const RegionList& regions);
ROUTING_EXPORT std::optional<RegionList> regionsFromJson(const QJsonArray& array, QString* error = nullptr);

ROUTING_EXPORT QDebug operator<<(QDebug debug, const Region& region);

} // namespace Routing
