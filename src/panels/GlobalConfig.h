// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include "core/constants.h"
#include "core/types.h"
#include <QJsonObject>
#include <QVariantMap>

namespace PanelDock {

/**
 * @brief Configuration shared by all panels
 *
 * This is a value type (not QObject) for easy copying and comparison.
 * PanelManager owns the live instance; LayoutEngine and
 * ExclusivityController read it through a const pointer so that a new
 * setup() is picked up without reconstructing them.
 *
 * @note Default values here must match PanelDefaults in constants.h.
 */
struct PANELDOCK_EXPORT GlobalConfig
{
    // ═══════════════════════════════════════════════════════════════════════
    // Edge default sizes
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Default width of left panels
     *
     * >= 1 is absolute columns, below 1 a fraction of the total columns.
     * Default: 40 columns
     */
    qreal leftWidth = PanelDefaults::LeftWidth;

    /// Default width of right panels. Default: 40 columns
    qreal rightWidth = PanelDefaults::RightWidth;

    /// Default height of top panels. Default: 40% of the total lines
    qreal topHeight = PanelDefaults::TopHeight;

    /// Default height of bottom panels. Default: 40% of the total lines
    qreal bottomHeight = PanelDefaults::BottomHeight;

    // ═══════════════════════════════════════════════════════════════════════
    // Window setup
    // ═══════════════════════════════════════════════════════════════════════

    /// Move panel windows to their edge when set up
    bool move = PanelDefaults::Move;

    /// Options applied to every panel window and its content
    QVariantMap defaultOptions = builtinOptions();

    // ═══════════════════════════════════════════════════════════════════════
    // Behavior
    // ═══════════════════════════════════════════════════════════════════════

    /// Close the view (or quit) when entering a view that only holds panels
    bool closeViewWhenOnlyPanelsRemain = PanelDefaults::CloseViewWhenOnlyPanelsRemain;

    /// Create a PanelStatusIndicator fed by settle notifications
    bool statusIndicator = PanelDefaults::StatusIndicator;

    /**
     * @brief Interval between close-completion polls
     *
     * Range: 1 to 1000
     * Default: 30
     */
    int pollIntervalMs = PanelDefaults::PollIntervalMs;

    /**
     * @brief Give up waiting for a closed panel after this long
     *
     * Range: 0 to 60000, 0 waits indefinitely
     * Default: 0
     */
    int closeTimeoutMs = PanelDefaults::CloseTimeoutMs;

    /**
     * @brief Default size for panels on an edge
     * @return 0 for Edge::Invalid
     */
    qreal defaultSizeForEdge(Edge edge) const;

    bool operator==(const GlobalConfig& other) const;
    bool operator!=(const GlobalConfig& other) const;

    QJsonObject toJson() const;

    /**
     * @brief Deserialize from JSON
     *
     * Missing keys keep their defaults. Non-positive sizes are rejected with
     * a warning, intervals are clamped to their ranges. The "options" object
     * is merged over the built-in options.
     */
    static GlobalConfig fromJson(const QJsonObject& json);

    /// The option set applied when nothing else is configured
    static QVariantMap builtinOptions();
};

} // namespace PanelDock

Q_DECLARE_METATYPE(PanelDock::GlobalConfig)
