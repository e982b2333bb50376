// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "LayoutEngine.h"
#include "GlobalConfig.h"
#include "PanelConfig.h"
#include "core/constants.h"
#include "core/interfaces.h"
#include "core/logging.h"
#include <QtMath>
#include <QtNumeric>
#include <algorithm>

namespace PanelDock {

LayoutEngine::LayoutEngine(IWindowHost* host, const GlobalConfig* config)
    : m_host(host)
    , m_config(config)
{
}

int LayoutEngine::resolveSize(qreal value, int totalCells)
{
    if (!qIsFinite(value) || value <= 0) {
        return PanelDefaults::MinPanelCells;
    }
    // Clamp before converting, the cast is undefined outside the int range
    qreal cells = value >= 1.0 ? value : qFloor(value * std::max(totalCells, 0));
    cells = std::clamp<qreal>(cells, PanelDefaults::MinPanelCells, PanelDefaults::MaxPanelCells);
    return static_cast<int>(cells);
}

int LayoutEngine::computeSize(const PanelConfig& panel, int totalCells) const
{
    qreal value = 0;
    if (panel.size.has_value()) {
        value = *panel.size;
    } else if (m_config) {
        value = m_config->defaultSizeForEdge(panel.edge);
    }
    return resolveSize(value, totalCells);
}

bool LayoutEngine::shouldMove(const PanelConfig& panel) const
{
    if (panel.moveOverride.has_value()) {
        return *panel.moveOverride;
    }
    return m_config ? m_config->move : PanelDefaults::Move;
}

QVariantMap LayoutEngine::effectiveOptions(const PanelConfig& panel) const
{
    QVariantMap options = m_config ? m_config->defaultOptions : GlobalConfig::builtinOptions();
    for (auto it = panel.optionOverrides.constBegin(); it != panel.optionOverrides.constEnd(); ++it) {
        options.insert(it.key(), it.value());
    }
    return options;
}

void LayoutEngine::reposition(const PanelConfig& panel, WindowHandle window)
{
    if (!m_host || window == InvalidWindow || !shouldMove(panel)) {
        return;
    }

    const WindowHandle previous = m_host->currentWindow();
    m_host->setCurrentWindow(window);
    m_host->moveWindowToEdge(window, panel.edge);

    if (previous != InvalidWindow && m_host->isWindowValid(previous)) {
        m_host->setCurrentWindow(previous);
    }
}

void LayoutEngine::resize(const PanelConfig& panel, WindowHandle window)
{
    if (!m_host || window == InvalidWindow) {
        return;
    }

    if (isSideEdge(panel.edge)) {
        const int width = computeSize(panel, m_host->totalColumns());
        qCDebug(lcLayout) << "Panel" << panel.name << "width" << width;
        m_host->setWindowWidth(window, width);
    } else {
        const int height = computeSize(panel, m_host->totalLines());
        qCDebug(lcLayout) << "Panel" << panel.name << "height" << height;
        m_host->setWindowHeight(window, height);
    }
}

void LayoutEngine::applyOptions(const PanelConfig& panel, WindowHandle window)
{
    if (!m_host || window == InvalidWindow) {
        return;
    }

    const QVariantMap options = effectiveOptions(panel);
    for (auto it = options.constBegin(); it != options.constEnd(); ++it) {
        if (!m_host->setWindowOption(window, it.key(), it.value())) {
            qCDebug(lcLayout) << "Window option" << it.key() << "not applied to" << panel.name;
        }
        if (!m_host->setContentOption(window, it.key(), it.value())) {
            qCDebug(lcLayout) << "Content option" << it.key() << "not applied to" << panel.name;
        }
    }
}

bool LayoutEngine::ensureCloseMapping(WindowHandle window)
{
    if (!m_host || window == InvalidWindow) {
        return false;
    }

    const QString key = CloseMapping::Key;
    if (m_host->hasKeyMapping(window, key)) {
        return false;
    }
    m_host->setKeyMapping(window, key, CloseMapping::Action);
    return true;
}

void LayoutEngine::setupWindow(const PanelConfig& panel, WindowHandle window)
{
    reposition(panel, window);
    resize(panel, window);
    applyOptions(panel, window);
    ensureCloseMapping(window);
}

ViewSnapshot LayoutEngine::snapshotViews() const
{
    ViewSnapshot snapshot;
    if (!m_host || m_host->hasStableViewports()) {
        return snapshot;
    }

    const QList<WindowHandle> windows = m_host->windowsInView();
    for (WindowHandle window : windows) {
        snapshot.insert(window, m_host->saveView(window));
    }
    return snapshot;
}

void LayoutEngine::restoreViews(const ViewSnapshot& snapshot)
{
    if (!m_host || snapshot.isEmpty()) {
        return;
    }

    const WindowHandle current = m_host->currentWindow();
    for (auto it = snapshot.constBegin(); it != snapshot.constEnd(); ++it) {
        if (m_host->isWindowValid(it.key())) {
            m_host->restoreView(it.key(), it.value());
        }
    }
    if (current != InvalidWindow && m_host->isWindowValid(current) && m_host->currentWindow() != current) {
        m_host->setCurrentWindow(current);
    }
}

ViewRestoreGuard::ViewRestoreGuard(LayoutEngine* engine, bool active)
    : m_engine(active ? engine : nullptr)
{
    if (m_engine) {
        m_snapshot = m_engine->snapshotViews();
    }
}

ViewRestoreGuard::~ViewRestoreGuard()
{
    if (m_engine) {
        m_engine->restoreViews(m_snapshot);
    }
}

} // namespace PanelDock
