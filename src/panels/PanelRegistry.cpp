// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "PanelRegistry.h"
#include "core/logging.h"

namespace PanelDock {

PanelRegistry::PanelRegistry(QObject* parent)
    : QObject(parent)
{
}

PanelRegistry::~PanelRegistry() = default;

PanelError PanelRegistry::registerPanel(const PanelConfig& config)
{
    if (config.name.isEmpty()) {
        qCWarning(lcRegistry) << "Rejecting panel without a name";
        return PanelError::InvalidConfig;
    }
    if (!isValidEdge(config.edge)) {
        qCWarning(lcRegistry) << "Rejecting panel" << config.name << "- edge is not left, right, top or bottom";
        return PanelError::InvalidConfig;
    }
    if (!config.hasLocator()) {
        qCWarning(lcRegistry) << "Rejecting panel" << config.name << "- needs a resolver or a predicate";
        return PanelError::InvalidConfig;
    }
    if (config.openAction.isNull()) {
        qCWarning(lcRegistry) << "Rejecting panel" << config.name << "- no open action";
        return PanelError::InvalidConfig;
    }
    QString badPattern;
    if (!config.hasValidExemptPatterns(&badPattern)) {
        qCWarning(lcRegistry) << "Rejecting panel" << config.name << "- invalid exemptFrom pattern" << badPattern;
        return PanelError::InvalidConfig;
    }

    auto existing = m_panels.constFind(config.name);
    if (existing != m_panels.constEnd()) {
        if (existing->edge != config.edge) {
            m_edgeIndex[existing->edge].removeOne(config.name);
            m_edgeIndex[config.edge].append(config.name);
        }
        qCDebug(lcRegistry) << "Replacing panel" << config.name;
    } else {
        m_registrationOrder.append(config.name);
        m_edgeIndex[config.edge].append(config.name);
        qCDebug(lcRegistry) << "Registered panel" << config.name << "at" << edgeToString(config.edge);
    }
    m_panels.insert(config.name, config);

    Q_EMIT panelRegistered(config.name);
    return PanelError::None;
}

const PanelConfig* PanelRegistry::panel(const QString& name) const
{
    auto it = m_panels.constFind(name);
    if (it == m_panels.constEnd()) {
        return nullptr;
    }
    return &it.value();
}

bool PanelRegistry::contains(const QString& name) const noexcept
{
    return m_panels.contains(name);
}

QStringList PanelRegistry::panelNames() const noexcept
{
    return m_registrationOrder;
}

QList<PanelConfig> PanelRegistry::allPanels() const
{
    QList<PanelConfig> result;
    result.reserve(m_registrationOrder.size());
    for (const QString& name : m_registrationOrder) {
        result.append(m_panels.value(name));
    }
    return result;
}

QStringList PanelRegistry::namesAtEdge(Edge edge) const
{
    return m_edgeIndex.value(edge);
}

QStringList PanelRegistry::completePanelNames(const QString& prefix) const
{
    QStringList result;
    for (const QString& name : m_registrationOrder) {
        if (name.startsWith(prefix)) {
            result.append(name);
        }
    }
    result.sort();
    return result;
}

int PanelRegistry::count() const noexcept
{
    return static_cast<int>(m_panels.size());
}

} // namespace PanelDock
