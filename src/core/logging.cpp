// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace PanelDock {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "paneldock.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRegistry, "paneldock.core.registry", QtInfoMsg)
Q_LOGGING_CATEGORY(lcLayout, "paneldock.core.layout", QtInfoMsg)
Q_LOGGING_CATEGORY(lcController, "paneldock.core.controller", QtInfoMsg)

// Status indicator
Q_LOGGING_CATEGORY(lcStatus, "paneldock.status", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "paneldock.config", QtInfoMsg)

// D-Bus module categories
Q_LOGGING_CATEGORY(lcDbus, "paneldock.dbus", QtInfoMsg)

} // namespace PanelDock
