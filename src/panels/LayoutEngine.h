// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include "core/types.h"
#include <QVariantMap>

namespace PanelDock {

class IWindowHost;
struct GlobalConfig;
struct PanelConfig;

/**
 * @brief Applies the configured geometry and options to panel windows
 *
 * Sizes follow one rule everywhere: a value >= 1 is an absolute cell count
 * (fractional part dropped), a value below 1 is a fraction of the total
 * columns (left/right) or lines (top/bottom). The result is never below
 * one cell.
 *
 * All methods tolerate handles that became invalid; the host is expected to
 * ignore them.
 */
class PANELDOCK_EXPORT LayoutEngine
{
public:
    LayoutEngine(IWindowHost* host, const GlobalConfig* config);

    // ═══════════════════════════════════════════════════════════════════════════
    // Resolution
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Resolve a panel's size to a cell count
     *
     * @param panel Panel whose size (or edge default) is used
     * @param totalCells Total columns or lines of the editing surface
     * @return Cell count, at least 1
     */
    int computeSize(const PanelConfig& panel, int totalCells) const;

    /// Resolve a raw size value against @p totalCells
    static int resolveSize(qreal value, int totalCells);

    /// Panel moveOverride if set, else GlobalConfig::move
    bool shouldMove(const PanelConfig& panel) const;

    /// GlobalConfig::defaultOptions with the panel's overrides merged over
    QVariantMap effectiveOptions(const PanelConfig& panel) const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Window setup
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Move a panel window to its edge
     *
     * Skipped when moving is disabled for the panel. Focus returns to the
     * previously current window if it still exists.
     */
    void reposition(const PanelConfig& panel, WindowHandle window);

    void resize(const PanelConfig& panel, WindowHandle window);

    /**
     * @brief Apply the effective options to the window and to its content
     *
     * Every option is tried on both targets. Rejections are expected (an
     * option usually exists on only one of them) and logged at debug level.
     */
    void applyOptions(const PanelConfig& panel, WindowHandle window);

    /**
     * @brief Install the 'q' close mapping unless the content already maps 'q'
     * @return true if a mapping was installed
     */
    bool ensureCloseMapping(WindowHandle window);

    /// reposition, resize, applyOptions and ensureCloseMapping in that order
    void setupWindow(const PanelConfig& panel, WindowHandle window);

    // ═══════════════════════════════════════════════════════════════════════════
    // View preservation
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Capture the view state of every window in the current view
     * @return Empty snapshot when the host keeps viewports stable itself
     */
    ViewSnapshot snapshotViews() const;

    /**
     * @brief Restore a snapshot taken by snapshotViews()
     *
     * Windows that no longer exist are skipped. The current window is
     * preserved.
     */
    void restoreViews(const ViewSnapshot& snapshot);

private:
    IWindowHost* m_host;
    const GlobalConfig* m_config;
};

/**
 * @brief Scoped snapshotViews()/restoreViews() pair
 *
 * Restores on every exit path, including exceptions thrown by panel
 * callbacks. A guard constructed with @c active = false does nothing.
 */
class PANELDOCK_EXPORT ViewRestoreGuard
{
public:
    explicit ViewRestoreGuard(LayoutEngine* engine, bool active = true);
    ~ViewRestoreGuard();

    Q_DISABLE_COPY_MOVE(ViewRestoreGuard)

private:
    LayoutEngine* m_engine;
    ViewSnapshot m_snapshot;
};

} // namespace PanelDock
