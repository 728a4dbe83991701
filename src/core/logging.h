// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "elixi_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for Elixi Shell
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcSession) << "Debug message";
 *   qCWarning(lcDbus) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="elixi.*=true"                    # Enable all
 *   QT_LOGGING_RULES="elixi.*.debug=false"             # Disable debug only
 *   QT_LOGGING_RULES="elixi.core.session.debug=true"   # Trace pointer sessions
 *
 * Severity Guidelines:
 *   qCDebug    - Per-event tracing (pointer moves, dropped events)
 *   qCInfo     - Session start/end, initial placement, startup
 *   qCWarning  - Failed D-Bus replies, invalid configuration, missing UI items
 *   qCCritical - The shell window cannot be created
 */

namespace Elixi {

// Core module - bounds, direction parsing, geometry helpers
ELIXI_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)

// Pointer session state machine and drag/resize controllers
ELIXI_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcSession)

// D-Bus module - geometry owner channel
ELIXI_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

// Shell module - pointer routing, placement, window controls
ELIXI_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcShell)

// Configuration module - settings loading/validation
ELIXI_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace Elixi
