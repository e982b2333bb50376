// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include "PanelAction.h"
#include "core/types.h"
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <functional>
#include <optional>

namespace PanelDock {

/**
 * @brief Declarative description of one panel
 *
 * Created during setup and handed to PanelRegistry, which keeps its own copy
 * for the lifetime of the process. Registering another config with the same
 * name replaces it.
 *
 * A panel's window is found either by a custom resolver or by testing a
 * predicate against every window of the current view. When both are set the
 * resolver wins.
 */
struct PANELDOCK_EXPORT PanelConfig
{
    /// Unique key
    QString name;

    Edge edge = Edge::Invalid;

    // ═══════════════════════════════════════════════════════════════════════
    // Locator
    // ═══════════════════════════════════════════════════════════════════════

    /// Returns the panel's window, or InvalidWindow if it is not open
    std::function<WindowHandle()> resolver;

    /// Tested against each window of the current view in host order
    std::function<bool(WindowHandle)> predicate;

    // ═══════════════════════════════════════════════════════════════════════
    // Actions
    // ═══════════════════════════════════════════════════════════════════════

    PanelAction openAction;

    /// Null means "close the resolved window through the host"
    PanelAction closeAction;

    // ═══════════════════════════════════════════════════════════════════════
    // Layout
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Width (left/right) or height (top/bottom) override
     *
     * >= 1 is an absolute cell count, below 1 a fraction of the total.
     * Unset falls back to the edge default of GlobalConfig.
     */
    std::optional<qreal> size;

    /// Overrides GlobalConfig::move for this panel
    std::optional<bool> moveOverride;

    /// Merged over GlobalConfig::defaultOptions, panel values win
    QVariantMap optionOverrides;

    // ═══════════════════════════════════════════════════════════════════════
    // Exclusivity
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Names of same-edge panels this panel leaves open
     *
     * Each entry is a QRegularExpression pattern matched anywhere in the
     * other panel's name (unanchored). Use ^...$ for an exact match.
     */
    QStringList exemptFrom;

    /// Glyph shown by the status indicator, empty for the default icon
    QString icon;

    bool hasLocator() const
    {
        return static_cast<bool>(resolver) || static_cast<bool>(predicate);
    }

    /**
     * @brief Check if opening this panel must leave @p otherName open
     */
    bool keepsOpen(const QString& otherName) const;

    /**
     * @brief Check every exemptFrom entry compiles as a regular expression
     * @param invalidPattern If non-null, receives the first invalid pattern
     */
    bool hasValidExemptPatterns(QString* invalidPattern = nullptr) const;
};

} // namespace PanelDock
