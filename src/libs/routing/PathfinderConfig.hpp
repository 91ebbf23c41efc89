// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "routing/RoutingGlobal.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QRect>
#include <QtCore/QString>

#include <optional>

namespace Routing {

struct ROUTING_EXPORT PathfinderConfig final {
    static constexpr int kDefaultStepCost = 1;
    static constexpr double kDefaultTurnPenaltyRatio = 2.0;
    static constexpr int kDefaultMaxExploredNodes = 100000;

    // Upper limits accepted from JSON. Search costs are summed in 64 bits, so
    // these keep a path of any reachable length far from overflow.
    static constexpr int kMaxStepCost = 1000000;
    static constexpr int kMaxTurnPenalty = 100000000;

    // Cost of one step. Grids measured in pixels rather than cells scale
    // this, and the turn penalty follows through the ratio.
    int stepCost = kDefaultStepCost;
    double turnPenaltyRatio = kDefaultTurnPenaltyRatio;

    // Expanded search states before the search reports Aborted.
    int maxExploredNodes = kDefaultMaxExploredNodes;

    // Cells outside are treated as blocked. A null rect leaves the grid open.
    QRect searchBounds;

    // turnPenaltyRatio * stepCost rounded, clamped to [0, kMaxTurnPenalty].
    int defaultTurnPenalty() const;
    bool isBounded() const { return !searchBounds.isNull(); }

    QJsonObject toJson() const;

    // Missing keys keep their defaults.
    static std::optional<PathfinderConfig> fromJson(const QJsonObject& object, QString* error = nullptr);
    static std::optional<PathfinderConfig> loadFromFile(const QString& path, QString* error = nullptr);
};

} // namespace Routing
