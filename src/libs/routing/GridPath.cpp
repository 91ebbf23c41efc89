// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "routing/GridPath.hpp"

#include <algorithm>
#include <cstdlib>

namespace Routing {

namespace {

int signum(int v)
{
    return (v > 0) ? 1 : (v < 0) ? -1 : 0;
}

QPoint direction(const QPoint& from, const QPoint& to)
{
    return QPoint(signum(to.x() - from.x()), signum(to.y() - from.y()));
}

Region spanRegion(const QPoint& a, const QPoint& b)
{
    const int left = std::min(a.x(), b.x());
    const int top = std::min(a.y(), b.y());
    return Region{left, top, std::abs(a.x() - b.x()) + 1, std::abs(a.y() - b.y()) + 1};
}

} // namespace

GridPath simplifyPath(const GridPath& path)
{
    if (path.size() < 3)
        return path;

    GridPath out;
    out.reserve(path.size());
    out.push_back(path.front());

    for (qsizetype i = 1; i + 1 < path.size(); ++i) {
        const QPoint in = direction(path[i - 1], path[i]);
        const QPoint outDir = direction(path[i], path[i + 1]);
        if (in != outDir)
            out.push_back(path[i]);
    }

    out.push_back(path.back());
    return out;
}

int pathLength(const GridPath& path)
{
    int length = 0;
    for (qsizetype i = 1; i < path.size(); ++i)
        length += (path[i] - path[i - 1]).manhattanLength();
    return length;
}

int turnCount(const GridPath& path)
{
    int turns = 0;
    QPoint prevDir;
    for (qsizetype i = 1; i < path.size(); ++i) {
        const QPoint dir = direction(path[i - 1], path[i]);
        if (dir.isNull())
            continue;
        if (!prevDir.isNull() && dir != prevDir)
            ++turns;
        prevDir = dir;
    }
    return turns;
}

qint64 pathCost(const GridPath& path, int stepCost, int turnPenalty)
{
    return qint64(pathLength(path)) * stepCost + qint64(turnCount(path)) * turnPenalty;
}

bool isOrthogonal(const GridPath& path)
{
    for (qsizetype i = 1; i < path.size(); ++i) {
        if (path[i].x() != path[i - 1].x() && path[i].y() != path[i - 1].y())
            return false;
    }
    return true;
}

RegionList regionsForPath(const GridPath& path)
{
    RegionList out;
    if (path.isEmpty())
        return out;

    if (path.size() == 1) {
        out.push_back(Region{path.front().x(), path.front().y()});
        return out;
    }

    for (qsizetype i = 1; i < path.size(); ++i) {
        const QPoint a = path[i - 1];
        const QPoint b = path[i];
        if (a.x() == b.x() || a.y() == b.y()) {
            out.push_back(spanRegion(a, b));
            continue;
        }

        const QPoint corner(b.x(), a.y());
        out.push_back(spanRegion(a, corner));
        out.push_back(spanRegion(corner, b));
    }
    return out;
}

} // namespace Routing
