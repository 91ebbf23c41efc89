// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "routing/RoutingGlobal.hpp"

Q_LOGGING_CATEGORY(routinglog, "gridroute.routing")
