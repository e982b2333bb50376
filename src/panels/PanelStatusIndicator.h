// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include "core/types.h"
#include <QMap>
#include <QObject>
#include <QString>

namespace PanelDock {

class PanelRegistry;

/**
 * @brief Status-line text listing the registered panels
 *
 * One part per registered panel in registration order: the panel's icon
 * (or the default icon), optionally followed by its name, prefixed by the
 * active or inactive highlight marker. Parts are joined by the separator.
 *
 * The active panel of each edge is fed by
 * ExclusivityController::activePanelChanged.
 */
class PANELDOCK_EXPORT PanelStatusIndicator : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString statusText READ statusText NOTIFY statusChanged)

public:
    struct Style
    {
        QString separator = QStringLiteral(" ");
        QString activeMarker = QStringLiteral("%#PanelDockActive#");
        QString inactiveMarker = QStringLiteral("%#PanelDockInactive#");
        bool showNames = false;
        QString defaultIcon = QStringLiteral("\U000F0349");
        /// Only list panels of this edge, Edge::Invalid for all edges
        Edge edgeFilter = Edge::Invalid;
    };

    explicit PanelStatusIndicator(const PanelRegistry* registry, QObject* parent = nullptr);
    ~PanelStatusIndicator() override = default;

    Style style() const
    {
        return m_style;
    }
    void setStyle(const Style& style);

    QString statusText() const
    {
        return m_statusText;
    }

    /// Active panel of @p edge, empty if none
    QString activePanel(Edge edge) const;

public Q_SLOTS:
    /**
     * @brief Record the active panel of an edge
     * @param name Empty when the edge was emptied
     */
    void setActivePanel(PanelDock::Edge edge, const QString& name);

    /// Rebuild the text, e.g. after panels were registered
    void refresh();

Q_SIGNALS:
    void statusChanged(const QString& text);

private:
    QString buildText() const;

    const PanelRegistry* m_registry;
    Style m_style;
    QMap<Edge, QString> m_active;
    QString m_statusText;
};

} // namespace PanelDock
