// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include "core/types.h"
#include <QString>

namespace PanelDock {

class IWindowHost;
class PanelRegistry;
struct PanelConfig;

/**
 * @brief Maps panel definitions to live host windows
 *
 * Stateless: every call queries the host again, since window handles can be
 * invalidated between operations.
 */
class PANELDOCK_EXPORT WindowLocator
{
public:
    WindowLocator(const PanelRegistry* registry, IWindowHost* host);

    /**
     * @brief Find the live window of a panel
     *
     * Uses the resolver when one is set, otherwise the first window of the
     * current view (host enumeration order) accepted by the predicate.
     * A resolver result the host no longer knows is treated as not found.
     *
     * @return InvalidWindow when the panel has no live window
     */
    WindowHandle resolve(const PanelConfig& panel) const;

    /// @overload Returns InvalidWindow for unregistered names
    WindowHandle resolve(const QString& name) const;

    /**
     * @brief Live windows of all panels registered at @p edge
     *
     * If two panels resolve to the same window, the one registered first
     * keeps it.
     */
    EdgeWindows findAllAtEdge(Edge edge) const;

    /**
     * @brief Check if a window belongs to any registered panel
     * @param window Window to test, InvalidWindow for the current window
     */
    bool isPanel(WindowHandle window = InvalidWindow) const;

    /**
     * @brief Name of the panel owning @p window
     * @return Empty string if the window is not a panel
     */
    QString panelForWindow(WindowHandle window) const;

private:
    bool matches(const PanelConfig& panel, WindowHandle window) const;

    const PanelRegistry* m_registry;
    IWindowHost* m_host;
};

} // namespace PanelDock
