// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "routing/Pathfinder.hpp"

#include <QtCore/QDebug>

#include <algorithm>
#include <limits>
#include <utility>

namespace Routing {

Pathfinder::Pathfinder(const Api::IOccupancySource& occupancy, PathfinderConfig config)
    : m_occupancy(occupancy)
    , m_config(std::move(config))
{}

PathResult Pathfinder::findPath(const QPoint& start, const QPoint& goal) const
{
    return findPath(start, goal, m_config.defaultTurnPenalty());
}

PathResult Pathfinder::findPath(const QPoint& start, const QPoint& goal, int turnPenalty) const
{
    PathResult result;

    if (turnPenalty < 0) {
        qCWarning(routinglog) << "findPath: negative turn penalty" << turnPenalty << "clamped to 0";
        turnPenalty = 0;
    }

    if (!isTraversable(start.x(), start.y()) || !isTraversable(goal.x(), goal.y())) {
        qCDebug(routinglog) << "findPath: endpoint blocked" << start << "->" << goal;
        result.status = PathResult::Status::EndpointBlocked;
        return result;
    }

    SearchState state;
    state.goal = goal;
    state.turnPenalty = turnPenalty;
    pushStart(state, start);

    while (!state.open.empty()) {
        const OpenEntry entry = state.open.top();
        state.open.pop();

        if (isStaleEntry(state, entry))
            continue;

        const SearchNode& cur = state.nodes[static_cast<size_t>(entry.index)];
        if (cur.x == goal.x() && cur.y == goal.y()) {
            result.status = PathResult::Status::Found;
            result.cost = cur.g;
            result.path = simplifyPath(rebuildPath(state, entry.index));
            result.exploredNodes = state.explored;
            return result;
        }

        if (state.explored >= m_config.maxExploredNodes) {
            qCDebug(routinglog) << "findPath: aborted after" << state.explored << "states"
                                << start << "->" << goal;
            result.status = PathResult::Status::Aborted;
            result.exploredNodes = state.explored;
            return result;
        }

        state.nodes[static_cast<size_t>(entry.index)].closed = true;
        ++state.explored;
        expandNode(state, entry.index);
    }

    qCDebug(routinglog) << "findPath: no path" << start << "->" << goal
                        << "after" << state.explored << "states";
    result.status = PathResult::Status::NoPath;
    result.exploredNodes = state.explored;
    return result;
}

bool Pathfinder::isTraversable(int x, int y) const
{
    if (m_config.isBounded() && !m_config.searchBounds.contains(x, y))
        return false;
    return !m_occupancy.isOccupied(x, y);
}

bool Pathfinder::isStaleEntry(const SearchState& state, const OpenEntry& entry)
{
    const SearchNode& node = state.nodes[static_cast<size_t>(entry.index)];
    return node.closed || node.f != entry.f;
}

void Pathfinder::pushStart(SearchState& state, const QPoint& start) const
{
    SearchNode node;
    node.x = start.x();
    node.y = start.y();
    node.h = heuristic(node.x, node.y, state.goal);
    node.f = node.h;
    node.seq = state.nextSeq++;

    state.nodes.push_back(node);
    state.index.emplace(StateKey{node.x, node.y, Heading::None}, 0);
    state.open.push(OpenEntry{node.f, node.seq, 0});
}

void Pathfinder::expandNode(SearchState& state, int nodeIndex) const
{
    const auto steps = stepsFrom(state.nodes[static_cast<size_t>(nodeIndex)].heading);
    for (const HeadingStep& step : steps)
        tryEnqueueNeighbor(state, nodeIndex, step);
}

void Pathfinder::tryEnqueueNeighbor(SearchState& state, int nodeIndex, const HeadingStep& step) const
{
    const SearchNode cur = state.nodes[static_cast<size_t>(nodeIndex)];
    const qint64 wideX = qint64(cur.x) + step.dx;
    const qint64 wideY = qint64(cur.y) + step.dy;
    if (wideX < std::numeric_limits<int>::min() || wideX > std::numeric_limits<int>::max()
        || wideY < std::numeric_limits<int>::min() || wideY > std::numeric_limits<int>::max())
        return;
    const int nx = static_cast<int>(wideX);
    const int ny = static_cast<int>(wideY);

    const StateKey key{nx, ny, step.heading};
    const auto it = state.index.find(key);
    if (it != state.index.end() && state.nodes[static_cast<size_t>(it->second)].closed)
        return;

    if (!isTraversable(nx, ny))
        return;

    const qint64 ng = cur.g + moveCost(cur.heading, step.heading, state.turnPenalty);

    if (it != state.index.end()) {
        SearchNode& existing = state.nodes[static_cast<size_t>(it->second)];
        if (ng >= existing.g)
            return;
        existing.g = ng;
        existing.f = ng + existing.h;
        existing.parent = nodeIndex;
        state.open.push(OpenEntry{existing.f, existing.seq, it->second});
        return;
    }

    SearchNode node;
    node.x = nx;
    node.y = ny;
    node.heading = step.heading;
    node.g = ng;
    node.h = heuristic(nx, ny, state.goal);
    node.f = ng + node.h;
    node.parent = nodeIndex;
    node.seq = state.nextSeq++;

    const int idx = static_cast<int>(state.nodes.size());
    state.nodes.push_back(node);
    state.index.emplace(key, idx);
    state.open.push(OpenEntry{node.f, node.seq, idx});
}

GridPath Pathfinder::rebuildPath(const SearchState& state, int goalIndex) const
{
    GridPath cells;
    for (int cur = goalIndex; cur != -1; cur = state.nodes[static_cast<size_t>(cur)].parent) {
        const SearchNode& node = state.nodes[static_cast<size_t>(cur)];
        cells.push_back(QPoint(node.x, node.y));
    }
    std::reverse(cells.begin(), cells.end());
    return cells;
}

qint64 Pathfinder::heuristic(int x, int y, const QPoint& goal) const
{
    const qint64 manhattan = qAbs(qint64(x) - goal.x()) + qAbs(qint64(y) - goal.y());
    return manhattan * m_config.stepCost;
}

qint64 Pathfinder::moveCost(Heading from, Heading to, int turnPenalty) const
{
    if (from == Heading::None || from == to)
        return m_config.stepCost;
    return qint64(m_config.stepCost) + turnPenalty;
}

std::array<Pathfinder::HeadingStep, 4> Pathfinder::stepsFrom(Heading current)
{
    if (current == Heading::None)
        return kHeadingSteps;

    std::array<HeadingStep, 4> ordered = kHeadingSteps;
    std::stable_partition(ordered.begin(), ordered.end(),
                          [current](const HeadingStep& s) { return s.heading == current; });
    return ordered;
}

const char* statusName(PathResult::Status status)
{
    switch (status) {
        case PathResult::Status::Found: return "Found";
        case PathResult::Status::NoPath: return "NoPath";
        case PathResult::Status::EndpointBlocked: return "EndpointBlocked";
        case PathResult::Status::Aborted: return "Aborted";
    }
    return "Unknown";
}

} // namespace Routing
