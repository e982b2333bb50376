// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ExclusivityController.h"
#include "GlobalConfig.h"
#include "LayoutEngine.h"
#include "PanelConfig.h"
#include "PanelRegistry.h"
#include "WindowLocator.h"
#include "core/constants.h"
#include "core/interfaces.h"
#include "core/logging.h"
#include <QPair>
#include <utility>

namespace PanelDock {

ExclusivityController::ExclusivityController(PanelRegistry* registry, WindowLocator* locator, LayoutEngine* layout,
                                             IWindowHost* host, IScheduler* scheduler, const GlobalConfig* config,
                                             QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_locator(locator)
    , m_layout(layout)
    , m_host(host)
    , m_scheduler(scheduler)
    , m_config(config)
{
}

ExclusivityController::~ExclusivityController() = default;

// ═══════════════════════════════════════════════════════════════════════════════
// Exclusivity operations
// ═══════════════════════════════════════════════════════════════════════════════

PanelError ExclusivityController::open(const QString& name)
{
    const PanelConfig* panel = lookup(name, "open");
    if (!panel) {
        return PanelError::UnknownPanel;
    }
    // Copy: a callback may register panels and invalidate the registry pointer
    const PanelConfig target = *panel;
    ViewRestoreGuard guard(m_layout, edgeDisturbsViews(target.edge));

    const EdgeWindows found = m_locator->findAllAtEdge(target.edge);
    int closedCount = 0;
    const PanelError result = closeSiblings(target, found, closedCount);
    if (result != PanelError::None) {
        return siblingCloseFailed(target, result, closedCount);
    }

    const WindowHandle window = found.key(target.name, InvalidWindow);
    if (window != InvalidWindow && m_host->isWindowValid(window)) {
        qCDebug(lcController) << "Panel" << target.name << "already open, focusing";
        focusWindow(window);
    } else {
        openPanel(target);
    }

    Q_EMIT activePanelChanged(target.edge, target.name);
    return PanelError::None;
}

PanelError ExclusivityController::switchTo(const QString& name)
{
    return open(name);
}

PanelError ExclusivityController::close(const QString& name)
{
    const PanelConfig* panel = lookup(name, "close");
    if (!panel) {
        return PanelError::UnknownPanel;
    }
    const PanelConfig target = *panel;
    ViewRestoreGuard guard(m_layout, edgeDisturbsViews(target.edge));

    const WindowHandle window = m_locator->resolve(target);
    if (window == InvalidWindow) {
        qCDebug(lcController) << "Panel" << target.name << "is not open";
        return PanelError::None;
    }

    const PanelError result = closePanel(target, window);
    Q_EMIT activePanelChanged(target.edge, QString());
    return result;
}

PanelError ExclusivityController::toggle(const QString& name)
{
    const PanelConfig* panel = lookup(name, "toggle");
    if (!panel) {
        return PanelError::UnknownPanel;
    }
    const PanelConfig target = *panel;
    ViewRestoreGuard guard(m_layout, edgeDisturbsViews(target.edge));

    const EdgeWindows found = m_locator->findAllAtEdge(target.edge);
    int closedCount = 0;
    PanelError result = closeSiblings(target, found, closedCount);
    if (result != PanelError::None) {
        return siblingCloseFailed(target, result, closedCount);
    }

    const WindowHandle window = found.key(target.name, InvalidWindow);
    if (window != InvalidWindow && m_host->isWindowValid(window)) {
        qCDebug(lcController) << "Toggling panel" << target.name << "off";
        moveFocusAway({window});
        result = closePanel(target, window);
        Q_EMIT activePanelChanged(target.edge, QString());
        return result;
    }

    qCDebug(lcController) << "Toggling panel" << target.name << "on";
    openPanel(target);
    Q_EMIT activePanelChanged(target.edge, target.name);
    return PanelError::None;
}

PanelError ExclusivityController::closeSide(Edge edge)
{
    return closeEdge(edge, QString());
}

PanelError ExclusivityController::closeSideExcept(Edge edge, const QString& exceptName)
{
    return closeEdge(edge, exceptName);
}

PanelError ExclusivityController::closeAll()
{
    ViewRestoreGuard guard(m_layout);

    PanelError firstError = PanelError::None;
    QList<Edge> emptied;
    const QList<PanelConfig> panels = m_registry->allPanels();
    for (const PanelConfig& panel : panels) {
        const WindowHandle window = m_locator->resolve(panel);
        if (window == InvalidWindow) {
            continue;
        }
        const PanelError result = closePanel(panel, window);
        if (firstError == PanelError::None) {
            firstError = result;
        }
        if (!emptied.contains(panel.edge)) {
            emptied.append(panel.edge);
        }
    }

    for (Edge edge : std::as_const(emptied)) {
        Q_EMIT activePanelChanged(edge, QString());
    }
    return firstError;
}

PanelError ExclusivityController::setupWindow(const QString& name, WindowHandle window)
{
    const PanelConfig* panel = lookup(name, "setupWindow");
    if (!panel) {
        return PanelError::UnknownPanel;
    }
    const PanelConfig target = *panel;

    if (window == InvalidWindow) {
        window = m_locator->resolve(target);
    }
    if (window == InvalidWindow || !m_host->isWindowValid(window)) {
        qCDebug(lcController) << "No window to set up for panel" << target.name;
        return PanelError::None;
    }

    m_layout->setupWindow(target, window);
    Q_EMIT activePanelChanged(target.edge, target.name);
    return PanelError::None;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

QStringList ExclusivityController::edgeState(Edge edge) const
{
    const EdgeWindows found = m_locator->findAllAtEdge(edge);
    QStringList live;
    const QStringList names = m_registry->namesAtEdge(edge);
    for (const QString& name : names) {
        if (found.key(name, InvalidWindow) != InvalidWindow) {
            live.append(name);
        }
    }
    return live;
}

bool ExclusivityController::closeViewIfOnlyPanelsRemain()
{
    if (!m_config || !m_config->closeViewWhenOnlyPanelsRemain) {
        return false;
    }

    const QList<WindowHandle> windows = m_host->windowsInView();
    if (windows.isEmpty()) {
        return false;
    }
    for (WindowHandle window : windows) {
        if (!m_locator->isPanel(window)) {
            return false;
        }
    }

    if (m_host->viewCount() > 1) {
        qCInfo(lcController) << "Only panels remain, closing view";
        m_host->closeCurrentView();
    } else {
        qCInfo(lcController) << "Only panels remain in the last view, quitting";
        m_host->quit();
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Internals
// ═══════════════════════════════════════════════════════════════════════════════

const PanelConfig* ExclusivityController::lookup(const QString& name, const char* operation) const
{
    const PanelConfig* panel = m_registry->panel(name);
    if (!panel) {
        qCWarning(lcController) << operation << "- unknown panel" << name;
    }
    return panel;
}

PanelError ExclusivityController::closeSiblings(const PanelConfig& target, const EdgeWindows& found, int& closedCount)
{
    closedCount = 0;
    QList<QPair<QString, WindowHandle>> closing;
    const QStringList names = m_registry->namesAtEdge(target.edge);
    for (const QString& name : names) {
        if (name == target.name) {
            continue;
        }
        const WindowHandle window = found.key(name, InvalidWindow);
        if (window == InvalidWindow) {
            continue;
        }
        if (target.keepsOpen(name)) {
            qCDebug(lcController) << "Keeping" << name << "open next to" << target.name;
            continue;
        }
        closing.append({name, window});
    }
    if (closing.isEmpty()) {
        return PanelError::None;
    }

    QList<WindowHandle> windows;
    windows.reserve(closing.size());
    for (const auto& entry : std::as_const(closing)) {
        windows.append(entry.second);
    }
    moveFocusAway(windows);

    for (const auto& entry : std::as_const(closing)) {
        const PanelConfig* sibling = m_registry->panel(entry.first);
        if (!sibling) {
            continue;
        }
        const PanelConfig copy = *sibling;
        qCDebug(lcController) << "Closing" << copy.name << "for" << target.name;
        const PanelError result = closePanel(copy, entry.second);
        if (result != PanelError::None) {
            return result;
        }
        ++closedCount;
    }
    return PanelError::None;
}

PanelError ExclusivityController::siblingCloseFailed(const PanelConfig& target, PanelError error, int closedCount)
{
    qCWarning(lcController) << "Not showing" << target.name << "-" << panelErrorToString(error);
    if (closedCount > 0) {
        Q_EMIT activePanelChanged(target.edge, QString());
    }
    return error;
}

void ExclusivityController::moveFocusAway(const QList<WindowHandle>& closing)
{
    if (closing.contains(m_host->currentWindow())) {
        m_host->focusPreviousWindow();
    }
}

PanelError ExclusivityController::closePanel(const PanelConfig& panel, WindowHandle window)
{
    if (panel.closeAction.isNull()) {
        m_host->closeWindow(window);
    } else {
        panel.closeAction.invoke(m_host);
    }
    return waitForClose(panel);
}

PanelError ExclusivityController::waitForClose(const PanelConfig& panel)
{
    const int interval = m_config ? m_config->pollIntervalMs : PanelDefaults::PollIntervalMs;
    const int timeout = m_config ? m_config->closeTimeoutMs : PanelDefaults::CloseTimeoutMs;
    const qint64 start = m_scheduler ? m_scheduler->elapsedMs() : 0;

    int polls = 0;
    while (m_locator->findAllAtEdge(panel.edge).key(panel.name, InvalidWindow) != InvalidWindow) {
        if (!m_scheduler) {
            qCWarning(lcController) << "No scheduler to wait for" << panel.name << "to close";
            return PanelError::CloseTimeout;
        }
        if (timeout > 0 && m_scheduler->elapsedMs() - start > timeout) {
            qCWarning(lcController) << "Panel" << panel.name << "still open after" << timeout << "ms";
            return PanelError::CloseTimeout;
        }
        m_scheduler->waitFor(interval);
        ++polls;
    }

    if (polls > 0) {
        qCDebug(lcController) << "Panel" << panel.name << "closed after" << polls << "polls";
    }
    return PanelError::None;
}

void ExclusivityController::openPanel(const PanelConfig& panel)
{
    qCDebug(lcController) << "Opening panel" << panel.name;
    panel.openAction.invoke(m_host);

    const WindowHandle window = m_locator->resolve(panel);
    if (window == InvalidWindow) {
        // Asynchronous opens are laid out later through setupWindow()
        qCDebug(lcController) << "Panel" << panel.name << "has no window yet";
        return;
    }
    m_layout->setupWindow(panel, window);
    focusWindow(window);
}

void ExclusivityController::focusWindow(WindowHandle window)
{
    if (m_host->currentWindow() != window) {
        m_host->setCurrentWindow(window);
    }
}

PanelError ExclusivityController::closeEdge(Edge edge, const QString& exceptName)
{
    if (!isValidEdge(edge)) {
        qCWarning(lcController) << "closeSide: invalid edge";
        return PanelError::InvalidConfig;
    }

    ViewRestoreGuard guard(m_layout);

    PanelError firstError = PanelError::None;
    bool closedAny = false;
    const QStringList names = m_registry->namesAtEdge(edge);
    for (const QString& name : names) {
        if (name == exceptName) {
            continue;
        }
        const PanelConfig* panel = m_registry->panel(name);
        if (!panel) {
            continue;
        }
        const PanelConfig copy = *panel;
        const WindowHandle window = m_locator->resolve(copy);
        if (window == InvalidWindow) {
            continue;
        }
        const PanelError result = closePanel(copy, window);
        if (firstError == PanelError::None) {
            firstError = result;
        }
        closedAny = true;
    }

    if (closedAny) {
        const bool exceptLive = !exceptName.isEmpty() && edgeState(edge).contains(exceptName);
        Q_EMIT activePanelChanged(edge, exceptLive ? exceptName : QString());
    }
    return firstError;
}

} // namespace PanelDock
