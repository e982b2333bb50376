// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include <QHash>
#include <QMetaType>
#include <QString>

namespace PanelDock {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Host window handle
 *
 * Handles are owned by the host and may be invalidated or reused between
 * calls, so they are never cached across controller operations.
 */
using WindowHandle = int;

/// Handle value meaning "no window"
constexpr WindowHandle InvalidWindow = 0;

/**
 * @brief Docking edge of a panel
 */
enum class Edge {
    Invalid = -1, ///< Not set or not recognized
    Left = 0,
    Right = 1,
    Top = 2,
    Bottom = 3
};

/// The four recognized edges, in iteration order
inline constexpr Edge AllEdges[] = {Edge::Left, Edge::Right, Edge::Top, Edge::Bottom};

/**
 * @brief Check that an edge is one of the four recognized values
 */
constexpr bool isValidEdge(Edge edge)
{
    return edge == Edge::Left || edge == Edge::Right || edge == Edge::Top || edge == Edge::Bottom;
}

/**
 * @brief Left/right panels are sized by width, top/bottom by height
 */
constexpr bool isSideEdge(Edge edge)
{
    return edge == Edge::Left || edge == Edge::Right;
}

/**
 * @brief Top/bottom layout changes can shift the viewports of other windows
 */
constexpr bool edgeDisturbsViews(Edge edge)
{
    return edge == Edge::Top || edge == Edge::Bottom;
}

/**
 * @brief Check that a configured panel size is usable
 *
 * Sizes must be finite, positive and no larger than PanelDefaults::MaxPanelCells.
 */
PANELDOCK_EXPORT bool isValidPanelSize(qreal value);

/**
 * @brief Convert an edge to its configuration name ("left", "right", ...)
 * @return Empty string for Edge::Invalid
 */
PANELDOCK_EXPORT QString edgeToString(Edge edge);

/**
 * @brief Parse an edge name (case-insensitive)
 * @return Edge::Invalid if the name is not recognized
 */
PANELDOCK_EXPORT Edge edgeFromString(const QString& name);

/**
 * @brief Error codes reported by fallible panel operations
 */
enum class PanelError {
    None = 0, ///< Success
    InvalidConfig = 1, ///< Malformed registration (missing name, edge, locator or open action)
    UnknownPanel = 2, ///< Operation referenced a panel that is not registered
    CloseTimeout = 3 ///< A closed panel's window did not disappear within closeTimeoutMs
};

/**
 * @brief Human-readable description of an error code
 */
PANELDOCK_EXPORT QString panelErrorToString(PanelError error);

/**
 * @brief Saved cursor and scroll position of one window
 */
struct PANELDOCK_EXPORT ViewState
{
    int topLine = 1; ///< First visible line
    int leftColumn = 0; ///< First visible column
    int cursorLine = 1;
    int cursorColumn = 0;

    bool operator==(const ViewState& other) const
    {
        return topLine == other.topLine && leftColumn == other.leftColumn && cursorLine == other.cursorLine
            && cursorColumn == other.cursorColumn;
    }
    bool operator!=(const ViewState& other) const
    {
        return !(*this == other);
    }
};

/// Per-window view states captured before a layout-disturbing operation
using ViewSnapshot = QHash<WindowHandle, ViewState>;

/// Live panel windows at an edge: window handle -> panel name
using EdgeWindows = QHash<WindowHandle, QString>;

} // namespace PanelDock

Q_DECLARE_METATYPE(PanelDock::Edge)
Q_DECLARE_METATYPE(PanelDock::PanelError)
