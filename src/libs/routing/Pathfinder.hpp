// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "routing/RoutingGlobal.hpp"
#include "routing/GridPath.hpp"
#include "routing/PathfinderConfig.hpp"
#include "routing/api/IOccupancySource.hpp"

#include <QtCore/QHash>
#include <QtCore/QPoint>
#include <QtCore/QtGlobal>

#include <array>
#include <queue>
#include <unordered_map>
#include <vector>

namespace Routing {

struct ROUTING_EXPORT PathResult final {
    enum class Status : unsigned char {
        Found,
        NoPath,          // every reachable state was expanded
        EndpointBlocked, // start or goal is occupied or out of bounds
        Aborted          // maxExploredNodes reached first
    };

    Status status = Status::NoPath;
    GridPath path;          // corner-simplified, empty unless Found
    qint64 cost = 0;        // search cost of path
    int exploredNodes = 0;  // expanded search states

    bool isFound() const { return status == Status::Found; }
    explicit operator bool() const { return isFound(); }
};

// A* over a 4-connected grid. States are (cell, arrival heading) so turn
// penalties are charged exactly and the returned path is cost-optimal for
// any non-negative penalty. Among states with equal f the earliest inserted
// is expanded first.
//
// findPath() keeps all of its working state on the stack, so concurrent
// calls are fine as long as the occupancy source is not being modified.
class ROUTING_EXPORT Pathfinder final
{
public:
    explicit Pathfinder(const Api::IOccupancySource& occupancy, PathfinderConfig config = {});

    const PathfinderConfig& config() const { return m_config; }

    PathResult findPath(const QPoint& start, const QPoint& goal) const;
    PathResult findPath(const QPoint& start, const QPoint& goal, int turnPenalty) const;

private:
    // Arrival heading of a search state. None only at the start cell.
    enum class Heading : qint8 { None = -1, East, West, South, North };

    struct HeadingStep final {
        Heading heading;
        int dx;
        int dy;
    };

    // Expansion order when the current heading is None. Otherwise the
    // current heading goes first so straight runs win ties.
    static constexpr std::array<HeadingStep, 4> kHeadingSteps = {{
        {Heading::East, 1, 0},
        {Heading::West, -1, 0},
        {Heading::South, 0, 1},
        {Heading::North, 0, -1},
    }};

    struct StateKey final {
        int x = 0;
        int y = 0;
        Heading heading = Heading::None;

        bool operator==(const StateKey&) const = default;
    };

    struct StateKeyHash final {
        size_t operator()(const StateKey& key) const noexcept
        {
            return qHashMulti(0, key.x, key.y, static_cast<int>(key.heading));
        }
    };

    // Arena entry. parent is an index into the same arena, -1 at the root.
    // Costs are 64-bit so large step costs cannot overflow.
    struct SearchNode final {
        int x = 0;
        int y = 0;
        Heading heading = Heading::None;
        qint64 g = 0;
        qint64 h = 0;
        qint64 f = 0;
        int parent = -1;
        quint64 seq = 0;
        bool closed = false;
    };

    struct OpenEntry final {
        qint64 f = 0;
        quint64 seq = 0;
        int index = -1;
    };

    struct OpenEntryCompare final {
        bool operator()(const OpenEntry& a, const OpenEntry& b) const
        {
            if (a.f != b.f)
                return a.f > b.f;
            return a.seq > b.seq;
        }
    };

    using OpenSet = std::priority_queue<OpenEntry, std::vector<OpenEntry>, OpenEntryCompare>;
    using NodeIndex = std::unordered_map<StateKey, int, StateKeyHash>;

    struct SearchState final {
        QPoint goal;
        int turnPenalty = 0;
        std::vector<SearchNode> nodes;
        NodeIndex index;
        OpenSet open;
        quint64 nextSeq = 0;
        int explored = 0;
    };

    bool isTraversable(int x, int y) const;
    static bool isStaleEntry(const SearchState& state, const OpenEntry& entry);

    void pushStart(SearchState& state, const QPoint& start) const;
    void expandNode(SearchState& state, int nodeIndex) const;
    void tryEnqueueNeighbor(SearchState& state, int nodeIndex, const HeadingStep& step) const;
    GridPath rebuildPath(const SearchState& state, int goalIndex) const;

    qint64 heuristic(int x, int y, const QPoint& goal) const;
    qint64 moveCost(Heading from, Heading to, int turnPenalty) const;
    static std::array<HeadingStep, 4> stepsFrom(Heading current);

    const Api::IOccupancySource& m_occupancy;
    PathfinderConfig m_config;
};

ROUTING_EXPORT const char* statusName(PathResult::Status status);

} // namespace Routing
