// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "panelsadaptor.h"

#include "core/logging.h"
#include "panels/PanelManager.h"

namespace PanelDock {

// ═══════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════

bool PanelsAdaptor::ensureManager(const char* methodName) const
{
    if (!m_manager) {
        qCWarning(lcDbus) << "Cannot" << methodName << "- panel manager not available";
        return false;
    }
    return true;
}

bool PanelsAdaptor::report(const char* methodName, const QString& argument, PanelError error) const
{
    if (error != PanelError::None) {
        qCWarning(lcDbus) << methodName << argument << "failed:" << panelErrorToString(error);
        return false;
    }
    return true;
}

Edge PanelsAdaptor::parseEdge(const char* methodName, const QString& edge) const
{
    const Edge parsed = edgeFromString(edge);
    if (parsed == Edge::Invalid) {
        qCWarning(lcDbus) << methodName << "- invalid edge" << edge;
    }
    return parsed;
}

PanelsAdaptor::PanelsAdaptor(PanelManager* manager, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_manager(manager)
{
    if (!m_manager) {
        qCWarning(lcDbus) << "PanelsAdaptor created with null manager";
        return;
    }

    connect(m_manager, &PanelManager::activePanelChanged, this, &PanelsAdaptor::onActivePanelChanged);

    qCDebug(lcDbus) << "PanelsAdaptor initialized";
}

void PanelsAdaptor::onActivePanelChanged(PanelDock::Edge edge, const QString& name)
{
    Q_EMIT activePanelChanged(edgeToString(edge), name);
}

// ═══════════════════════════════════════════════════════════════════════════
// Panel Operations
// ═══════════════════════════════════════════════════════════════════════════

bool PanelsAdaptor::open(const QString& name)
{
    if (!ensureManager("open")) {
        return false;
    }
    return report("open", name, m_manager->open(name));
}

bool PanelsAdaptor::switchTo(const QString& name)
{
    if (!ensureManager("switchTo")) {
        return false;
    }
    return report("switchTo", name, m_manager->switchTo(name));
}

bool PanelsAdaptor::close(const QString& name)
{
    if (!ensureManager("close")) {
        return false;
    }
    return report("close", name, m_manager->close(name));
}

bool PanelsAdaptor::toggle(const QString& name)
{
    if (!ensureManager("toggle")) {
        return false;
    }
    return report("toggle", name, m_manager->toggle(name));
}

bool PanelsAdaptor::closeSide(const QString& edge)
{
    if (!ensureManager("closeSide")) {
        return false;
    }
    const Edge parsed = parseEdge("closeSide", edge);
    if (parsed == Edge::Invalid) {
        return false;
    }
    return report("closeSide", edge, m_manager->closeSide(parsed));
}

bool PanelsAdaptor::closeSideExcept(const QString& edge, const QString& exceptName)
{
    if (!ensureManager("closeSideExcept")) {
        return false;
    }
    const Edge parsed = parseEdge("closeSideExcept", edge);
    if (parsed == Edge::Invalid) {
        return false;
    }
    return report("closeSideExcept", edge, m_manager->closeSideExcept(parsed, exceptName));
}

bool PanelsAdaptor::closeAll()
{
    if (!ensureManager("closeAll")) {
        return false;
    }
    return report("closeAll", QString(), m_manager->closeAll());
}

// ═══════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════

bool PanelsAdaptor::isPanel(int window)
{
    if (!ensureManager("isPanel")) {
        return false;
    }
    return m_manager->isPanel(window);
}

QStringList PanelsAdaptor::listPanels()
{
    if (!ensureManager("listPanels")) {
        return {};
    }
    return m_manager->listPanels();
}

QStringList PanelsAdaptor::completePanelNames(const QString& prefix)
{
    if (!ensureManager("completePanelNames")) {
        return {};
    }
    return m_manager->completePanelNames(prefix);
}

} // namespace PanelDock
