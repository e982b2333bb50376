// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include "core/types.h"
#include <QObject>
#include <QString>
#include <QStringList>

namespace PanelDock {

class IScheduler;
class IWindowHost;
class LayoutEngine;
class PanelRegistry;
class WindowLocator;
struct GlobalConfig;
struct PanelConfig;

/**
 * @brief Edge exclusivity state machine
 *
 * Each edge is either empty or shows one panel. Opening a panel closes the
 * other live panels of its edge, except those the opened panel lists in its
 * exemptFrom patterns. The state is never stored: every operation asks the
 * WindowLocator which panels are live right now.
 *
 * Closing is asynchronous on most hosts. After running a close action the
 * controller polls through the injected IScheduler until the panel's window
 * is gone, bounded by GlobalConfig::closeTimeoutMs when that is non-zero.
 *
 * Operations on top/bottom panels are bracketed by a ViewRestoreGuard, since
 * adding or removing a full-width window shifts the viewports of the others.
 * closeSide(), closeSideExcept() and closeAll() always use the guard.
 *
 * Exceptions thrown by callback actions are not caught here.
 *
 * @see PanelManager for the owning context
 */
class PANELDOCK_EXPORT ExclusivityController : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(ExclusivityController)

public:
    ExclusivityController(PanelRegistry* registry, WindowLocator* locator, LayoutEngine* layout, IWindowHost* host,
                          IScheduler* scheduler, const GlobalConfig* config, QObject* parent = nullptr);
    ~ExclusivityController() override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Exclusivity operations
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Show a panel, closing the non-exempt panels sharing its edge
     *
     * An already-live panel is only focused: no open action, no layout.
     * A newly opened window is laid out and focused.
     *
     * @return UnknownPanel for unregistered names, CloseTimeout if a sibling
     *         did not close in time (the panel is then not opened)
     */
    PanelError open(const QString& name);

    /// Same as open()
    PanelError switchTo(const QString& name);

    /**
     * @brief Close a panel if it is live
     *
     * A panel without a live window is left alone and reported as success.
     */
    PanelError close(const QString& name);

    /**
     * @brief Close the non-exempt siblings, then close the panel if it was
     *        live or open it otherwise
     */
    PanelError toggle(const QString& name);

    /// Close every live panel registered at @p edge
    PanelError closeSide(Edge edge);

    /**
     * @brief Close every live panel at @p edge except @p exceptName
     *
     * @p exceptName does not have to be registered.
     */
    PanelError closeSideExcept(Edge edge, const QString& exceptName);

    /// Close every live panel on all edges
    PanelError closeAll();

    /**
     * @brief Lay out a panel window that appeared outside open()/toggle()
     *
     * Does not close siblings.
     *
     * @param window The panel's window, InvalidWindow to resolve it
     */
    PanelError setupWindow(const QString& name, WindowHandle window = InvalidWindow);

    // ═══════════════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Names of the panels currently live at @p edge
     *
     * Empty list means the edge is empty. In registration order.
     */
    QStringList edgeState(Edge edge) const;

    /**
     * @brief Close the current view when only panel windows are left in it
     *
     * Does nothing unless GlobalConfig::closeViewWhenOnlyPanelsRemain is set.
     * Quits the host instead when this is the last view.
     *
     * @return true if the view was closed or quit was requested
     */
    bool closeViewIfOnlyPanelsRemain();

Q_SIGNALS:
    /**
     * @brief Emitted at every settle point
     * @param edge Edge whose state changed
     * @param name The now active panel, empty when the edge was emptied
     */
    void activePanelChanged(PanelDock::Edge edge, const QString& name);

private:
    const PanelConfig* lookup(const QString& name, const char* operation) const;

    /**
     * @brief Close the live siblings of @p target not exempted by it
     * @param found Live windows at the target's edge
     * @param closedCount Set to the number of siblings closed, also on failure
     */
    PanelError closeSiblings(const PanelConfig& target, const EdgeWindows& found, int& closedCount);

    /// Report an edge left partly closed by a failed sibling close
    PanelError siblingCloseFailed(const PanelConfig& target, PanelError error, int closedCount);

    /// Focus the previous window when the current one is in @p closing
    void moveFocusAway(const QList<WindowHandle>& closing);

    /// Run the close action (or close @p window) and wait until it is gone
    PanelError closePanel(const PanelConfig& panel, WindowHandle window);

    PanelError waitForClose(const PanelConfig& panel);

    /// Run the open action, then lay out and focus the new window
    void openPanel(const PanelConfig& panel);

    void focusWindow(WindowHandle window);

    /// Shared body of closeSide() and closeSideExcept()
    PanelError closeEdge(Edge edge, const QString& exceptName);

    PanelRegistry* m_registry;
    WindowLocator* m_locator;
    LayoutEngine* m_layout;
    IWindowHost* m_host;
    IScheduler* m_scheduler;
    const GlobalConfig* m_config;
};

} // namespace PanelDock
