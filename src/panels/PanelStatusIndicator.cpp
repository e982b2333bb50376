// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "PanelStatusIndicator.h"
#include "PanelConfig.h"
#include "PanelRegistry.h"
#include "core/logging.h"
#include <QStringList>

namespace PanelDock {

PanelStatusIndicator::PanelStatusIndicator(const PanelRegistry* registry, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
{
    if (m_registry) {
        connect(m_registry, &PanelRegistry::panelRegistered, this, &PanelStatusIndicator::refresh);
    }
    m_statusText = buildText();
}

void PanelStatusIndicator::setStyle(const Style& style)
{
    m_style = style;
    refresh();
}

QString PanelStatusIndicator::activePanel(Edge edge) const
{
    return m_active.value(edge);
}

void PanelStatusIndicator::setActivePanel(PanelDock::Edge edge, const QString& name)
{
    if (!isValidEdge(edge)) {
        return;
    }
    if (name.isEmpty()) {
        m_active.remove(edge);
    } else {
        m_active.insert(edge, name);
    }
    qCDebug(lcStatus) << "Active panel at" << edgeToString(edge) << "is now" << (name.isEmpty() ? QStringLiteral("<none>") : name);
    refresh();
}

void PanelStatusIndicator::refresh()
{
    const QString text = buildText();
    if (text == m_statusText) {
        return;
    }
    m_statusText = text;
    Q_EMIT statusChanged(m_statusText);
}

QString PanelStatusIndicator::buildText() const
{
    if (!m_registry) {
        return QString();
    }

    QStringList parts;
    const QList<PanelConfig> panels = m_registry->allPanels();
    for (const PanelConfig& panel : panels) {
        if (m_style.edgeFilter != Edge::Invalid && panel.edge != m_style.edgeFilter) {
            continue;
        }

        QString text = panel.icon.isEmpty() ? m_style.defaultIcon : panel.icon;
        if (m_style.showNames) {
            text += QLatin1Char(' ') + panel.name;
        }

        const bool active = m_active.value(panel.edge) == panel.name;
        parts.append((active ? m_style.activeMarker : m_style.inactiveMarker) + text);
    }
    return parts.join(m_style.separator);
}

} // namespace PanelDock
