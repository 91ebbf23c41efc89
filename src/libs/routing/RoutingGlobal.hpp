// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(ROUTING_BUILD_SHARED) && (ROUTING_BUILD_SHARED == 1)
#	if defined(ROUTING_LIBRARY)
#		define ROUTING_EXPORT Q_DECL_EXPORT
#	else
#		define ROUTING_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define ROUTING_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(routinglog)
