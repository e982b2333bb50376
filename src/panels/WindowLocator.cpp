// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "WindowLocator.h"
#include "PanelConfig.h"
#include "PanelRegistry.h"
#include "core/interfaces.h"
#include "core/logging.h"

namespace PanelDock {

WindowLocator::WindowLocator(const PanelRegistry* registry, IWindowHost* host)
    : m_registry(registry)
    , m_host(host)
{
}

WindowHandle WindowLocator::resolve(const PanelConfig& panel) const
{
    if (!m_host) {
        return InvalidWindow;
    }

    if (panel.resolver) {
        const WindowHandle window = panel.resolver();
        if (window == InvalidWindow || !m_host->isWindowValid(window)) {
            return InvalidWindow;
        }
        return window;
    }

    if (panel.predicate) {
        const QList<WindowHandle> windows = m_host->windowsInView();
        for (WindowHandle window : windows) {
            if (panel.predicate(window)) {
                return window;
            }
        }
    }
    return InvalidWindow;
}

WindowHandle WindowLocator::resolve(const QString& name) const
{
    const PanelConfig* panel = m_registry ? m_registry->panel(name) : nullptr;
    if (!panel) {
        return InvalidWindow;
    }
    return resolve(*panel);
}

EdgeWindows WindowLocator::findAllAtEdge(Edge edge) const
{
    EdgeWindows found;
    if (!m_registry) {
        return found;
    }

    const QStringList names = m_registry->namesAtEdge(edge);
    for (const QString& name : names) {
        const WindowHandle window = resolve(name);
        if (window == InvalidWindow) {
            continue;
        }
        if (found.contains(window)) {
            qCDebug(lcCore) << "Window" << window << "already claimed by" << found.value(window) << "- ignoring"
                            << name;
            continue;
        }
        found.insert(window, name);
    }
    return found;
}

bool WindowLocator::matches(const PanelConfig& panel, WindowHandle window) const
{
    if (panel.resolver) {
        return resolve(panel) == window;
    }
    return panel.predicate && panel.predicate(window);
}

bool WindowLocator::isPanel(WindowHandle window) const
{
    return !panelForWindow(window).isEmpty();
}

QString WindowLocator::panelForWindow(WindowHandle window) const
{
    if (!m_registry || !m_host) {
        return QString();
    }
    if (window == InvalidWindow) {
        window = m_host->currentWindow();
        if (window == InvalidWindow) {
            return QString();
        }
    }

    const QStringList names = m_registry->panelNames();
    for (const QString& name : names) {
        const PanelConfig* panel = m_registry->panel(name);
        if (panel && matches(*panel, window)) {
            return name;
        }
    }
    return QString();
}

} // namespace PanelDock
