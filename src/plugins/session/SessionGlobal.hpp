// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(SESSION_BUILD_SHARED) && (SESSION_BUILD_SHARED == 1)
#	if defined(SESSION_LIBRARY)
#		define SESSION_EXPORT Q_DECL_EXPORT
#	else
#		define SESSION_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define SESSION_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(sessionlog)
