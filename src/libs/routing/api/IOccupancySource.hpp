// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "routing/RoutingGlobal.hpp"

namespace Routing::Api {

// Read-only blocking test consulted by the pathfinder for every candidate
// cell. Implementations must answer consistently for the duration of a search.
class ROUTING_EXPORT IOccupancySource
{
public:
    virtual ~IOccupancySource() = default;

    virtual bool isOccupied(int x, int y) const = 0;
};

} // namespace Routing::Api
