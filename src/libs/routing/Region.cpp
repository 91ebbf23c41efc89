// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "routing/Region.hpp"

#include <QtCore/QDebug>
#include <QtCore/QJsonValue>

#include <cmath>
#include <limits>

namespace Routing {

namespace {

bool readInt(const QJsonObject& object, const QString& key, int* out, QString* error)
{
    const QJsonValue value = object.value(key);
    if (!value.isDouble()) {
        if (error)
            *error = QStringLiteral("Region field '%1' is missing or not a number.").arg(key);
        return false;
    }

    const double d = value.toDouble();
    if (std::trunc(d) != d) {
        if (error)
            *error = QStringLiteral("Region field '%1' is not an integer (%2).").arg(key).arg(d);
        return false;
    }
    if (d < static_cast<double>(std::numeric_limits<int>::min())
        || d > static_cast<double>(std::numeric_limits<int>::max())) {
        if (error)
            *error = QStringLiteral("Region field '%1' is out of range (%2).").arg(key).arg(d);
        return false;
    }

    *out = static_cast<int>(d);
    return true;
}

} // namespace

Region Region::fromRect(const QRect& rect)
{
    return Region{rect.x(), rect.y(), rect.width(), rect.height()};
}

QJsonObject Region::toJson() const
{
    QJsonObject o;
    o.insert(QStringLiteral("x"), x);
    o.insert(QStringLiteral("y"), y);
    if (dx != 1)
        o.insert(QStringLiteral("dx"), dx);
    if (dy != 1)
        o.insert(QStringLiteral("dy"), dy);
    return o;
}

std::optional<Region> Region::fromJson(const QJsonObject& object, QString* error)
{
    Region r;
    if (!readInt(object, QStringLiteral("x"), &r.x, error))
        return std::nullopt;
    if (!readInt(object, QStringLiteral("y"), &r.y, error))
        return std::nullopt;
    if (object.contains(QStringLiteral("dx")) && !readInt(object, QStringLiteral("dx"), &r.dx, error))
        return std::nullopt;
    if (object.contains(QStringLiteral("dy")) && !readInt(object, QStringLiteral("dy"), &r.dy, error))
        return std::nullopt;

    if (error)
        error->clear();
    return r;
}

bool containsPoint(const RegionList& regions, int x, int y)
{
    for (const auto& r : regions) {
        if (r.contains(x, y))
            return true;
    }
    return false;
}

QJsonArray regionsToJson(const RegionList& regions)
{
    QJsonArray out;
    for (const auto& r : regions)
        out.append(r.toJson());
    return out;
}

std::optional<RegionList> regionsFromJson(const QJsonArray& array, QString* error)
{
    RegionList out;
    out.reserve(array.size());
    for (qsizetype i = 0; i < array.size(); ++i) {
        const QJsonValue v = array.at(i);
        if (!v.isObject()) {
            if (error)
                *error = QStringLiteral("Region entry %1 is not an object.").arg(i);
            return std::nullopt;
        }

        QString entryError;
        const auto region = Region::fromJson(v.toObject(), &entryError);
        if (!region) {
            if (error)
                *error = QStringLiteral("Region entry %1: %2").arg(i).arg(entryError);
            return std::nullopt;
        }
        out.push_back(*region);
    }

    if (error)
        error->clear();
    return out;
}

QDebug operator<<(QDebug debug, const Region& region)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "Region(" << region.x << ", " << region.y
                    << " " << region.dx << "x" << region.dy << ")";
    return debug;
}

} // namespace Routing
