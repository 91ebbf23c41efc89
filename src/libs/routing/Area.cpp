// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "routing/Area.hpp"

#include <algorithm>
#include <vector>

namespace Routing {

namespace {

struct Interval final {
    int start = 0;
    int end = 0;
};

std::vector<int> stripEdges(const RegionList& regions)
{
    std::vector<int> xs;
    xs.reserve(static_cast<size_t>(regions.size()) * 2);
    for (const auto& r : regions) {
        xs.push_back(r.x);
        xs.push_back(r.right());
    }
    std::sort(xs.begin(), xs.end());
    xs.erase(std::unique(xs.begin(), xs.end()), xs.end());
    return xs;
}

std::vector<Interval> intervalsCoveringStrip(const RegionList& regions, int x1, int x2)
{
    std::vector<Interval> out;
    for (const auto& r : regions) {
        if (r.x <= x1 && r.right() >= x2)
            out.push_back(Interval{r.y, r.bottom()});
    }
    return out;
}

// Touching intervals (start == end) are joined as well as overlapping ones.
std::vector<Interval> mergeIntervals(std::vector<Interval> intervals)
{
    std::vector<Interval> merged;
    if (intervals.empty())
        return merged;

    std::stable_sort(intervals.begin(), intervals.end(),
                     [](const Interval& a, const Interval& b) { return a.start < b.start; });

    Interval cur = intervals.front();
    for (size_t i = 1; i < intervals.size(); ++i) {
        const Interval& next = intervals[i];
        if (next.start <= cur.end) {
            cur.end = std::max(cur.end, next.end);
            continue;
        }
        merged.push_back(cur);
        cur = next;
    }
    merged.push_back(cur);
    return merged;
}

} // namespace

Area::Area(const RegionList& initial)
{
    if (!initial.isEmpty())
        add(initial);
}

Area& Area::add(const RegionList& regions)
{
    if (regions.isEmpty())
        return *this;

    RegionList all = m_positive;
    all += regions;
    m_positive = mergeRegions(all);
    return *this;
}

Area& Area::subtract(const RegionList& regions)
{
    if (regions.isEmpty())
        return *this;

    RegionList all = m_negative;
    all += regions;
    m_negative = mergeRegions(all);
    return *this;
}

bool Area::isOccupied(int x, int y) const
{
    if (!containsPoint(m_positive, x, y))
        return false;
    return !containsPoint(m_negative, x, y);
}

QRect Area::boundingRect() const
{
    if (m_positive.isEmpty())
        return {};

    int left = m_positive.front().x;
    int top = m_positive.front().y;
    int right = m_positive.front().right();
    int bottom = m_positive.front().bottom();
    for (const auto& r : m_positive) {
        left = std::min(left, r.x);
        top = std::min(top, r.y);
        right = std::max(right, r.right());
        bottom = std::max(bottom, r.bottom());
    }
    return QRect(left, top, right - left, bottom - top);
}

Area Area::united(const Area& a, const Area& b)
{
    Area out;

    RegionList positive = a.m_positive;
    positive += b.m_positive;
    out.m_positive = mergeRegions(positive);

    RegionList negative = a.m_negative;
    negative += b.m_negative;
    out.m_negative = mergeRegions(negative);

    return out;
}

RegionList Area::mergeRegions(const RegionList& regions)
{
    RegionList result;
    if (regions.isEmpty())
        return result;

    const std::vector<int> xs = stripEdges(regions);
    for (size_t i = 0; i + 1 < xs.size(); ++i) {
        const int x1 = xs[i];
        const int x2 = xs[i + 1];
        const int stripWidth = x2 - x1;
        if (stripWidth <= 0)
            continue;

        const std::vector<Interval> merged = mergeIntervals(intervalsCoveringStrip(regions, x1, x2));
        for (const auto& iv : merged)
            result.push_back(Region{x1, iv.start, stripWidth, iv.end - iv.start});
    }

    return result;
}

} // namespace Routing
