// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include "../core/types.h"

#include <QDBusAbstractAdaptor>
#include <QObject>
#include <QString>
#include <QStringList>

namespace PanelDock {

class PanelManager;

/**
 * @brief D-Bus adaptor for panel control
 *
 * Provides D-Bus interface: org.paneldock.Panels
 * Exposes the PanelManager control surface to scripts and key bindings.
 *
 * Edges are passed as their configuration names ("left", "right", "top",
 * "bottom"). Methods return false when the call was rejected; the reason is
 * logged on the paneldock.dbus category.
 */
class PANELDOCK_EXPORT PanelsAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.paneldock.Panels")

public:
    /**
     * @param manager The PanelManager to expose via D-Bus
     * @param parent Parent QObject, the object registered on the bus
     */
    explicit PanelsAdaptor(PanelManager* manager, QObject* parent = nullptr);
    ~PanelsAdaptor() override = default;

public Q_SLOTS:
    bool open(const QString& name);
    bool switchTo(const QString& name);
    bool close(const QString& name);
    bool toggle(const QString& name);
    bool closeSide(const QString& edge);
    bool closeSideExcept(const QString& edge, const QString& exceptName);
    bool closeAll();

    /// @param window Host window handle, 0 for the current window
    bool isPanel(int window);

    QStringList listPanels();
    QStringList completePanelNames(const QString& prefix);

Q_SIGNALS:
    /**
     * @brief Relayed ExclusivityController::activePanelChanged
     * @param edge Edge name
     * @param name Active panel, empty when the edge was emptied
     */
    void activePanelChanged(const QString& edge, const QString& name);

private Q_SLOTS:
    void onActivePanelChanged(PanelDock::Edge edge, const QString& name);

private:
    bool ensureManager(const char* methodName) const;
    bool report(const char* methodName, const QString& argument, PanelError error) const;
    Edge parseEdge(const char* methodName, const QString& edge) const;

    PanelManager* m_manager;
};

} // namespace PanelDock
