// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for PanelDock
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "core/logging.h"
 *   qCDebug(lcController) << "Debug message";
 *   qCWarning(lcRegistry) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="paneldock.*=true"                  # Enable all
 *   QT_LOGGING_RULES="paneldock.*.debug=false"           # Disable debug only
 *   QT_LOGGING_RULES="paneldock.core.controller=true"    # State machine only
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing (poll iterations, per-key option failures)
 *   qCInfo     - Significant operational events (setup, panels registered)
 *   qCWarning  - Rejected calls: invalid config, unknown panel, close timeout
 *   qCCritical - Failures preventing normal operation
 */

namespace PanelDock {

// Core module - registry, locator, layout, state machine
PANELDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
PANELDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcRegistry)
PANELDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcLayout)
PANELDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcController)

// Status indicator
PANELDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcStatus)

// Configuration module - KConfig file loading
PANELDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

// D-Bus module - control surface
PANELDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

} // namespace PanelDock
