// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include "PanelConfig.h"
#include "core/types.h"
#include <QHash>
#include <QList>
#include <QMap>
#include <QObject>
#include <QString>
#include <QStringList>

namespace PanelDock {

/**
 * @brief Registry of panel definitions, indexed by name and by edge
 *
 * PanelRegistry keeps its own copy of every registered PanelConfig. It is
 * owned by PanelManager; there is no global instance, so several managers
 * (and every test) get independent registries.
 *
 * Usage:
 * @code
 * PanelConfig tree;
 * tree.name = QStringLiteral("tree");
 * tree.edge = Edge::Left;
 * tree.predicate = [host](WindowHandle w) { return host->contentType(w) == QLatin1String("filetree"); };
 * tree.openAction = PanelAction::command(QStringLiteral("FileTreeOpen"));
 * registry->registerPanel(tree);
 * @endcode
 *
 * Re-registering a name replaces the previous definition. If the edge
 * changed, the name moves to the new edge's list, keeping its position in
 * the overall registration order.
 */
class PANELDOCK_EXPORT PanelRegistry : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(PanelRegistry)

public:
    explicit PanelRegistry(QObject* parent = nullptr);
    ~PanelRegistry() override;

    /**
     * @brief Validate and store a panel definition
     *
     * Rejected with PanelError::InvalidConfig when the name is empty, the
     * edge is not recognized, there is neither a resolver nor a predicate,
     * there is no open action, or an exemptFrom pattern does not compile.
     * A rejected config leaves the registry unchanged.
     */
    PanelError registerPanel(const PanelConfig& config);

    /**
     * @brief Look up a panel by name
     * @return Pointer into the registry, or nullptr if not registered.
     *         Invalidated by the next registerPanel() call.
     */
    const PanelConfig* panel(const QString& name) const;

    bool contains(const QString& name) const noexcept;

    /// All panel names in registration order
    QStringList panelNames() const noexcept;

    /// Copies of all definitions in registration order
    QList<PanelConfig> allPanels() const;

    /// Names of the panels registered at @p edge, in registration order
    QStringList namesAtEdge(Edge edge) const;

    /**
     * @brief Names starting with @p prefix, for command-line completion
     *
     * An empty prefix returns every name. Sorted alphabetically.
     */
    QStringList completePanelNames(const QString& prefix) const;

    int count() const noexcept;

Q_SIGNALS:
    /**
     * @brief Emitted after a panel was registered or replaced
     */
    void panelRegistered(const QString& name);

private:
    QHash<QString, PanelConfig> m_panels;
    QStringList m_registrationOrder;
    QMap<Edge, QStringList> m_edgeIndex;
};

} // namespace PanelDock
