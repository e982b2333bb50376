// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include "GlobalConfig.h"
#include "PanelConfig.h"
#include "core/types.h"
#include <QDBusConnection>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>
#include <memory>

namespace PanelDock {

class ExclusivityController;
class IScheduler;
class IWindowHost;
class LayoutEngine;
class PanelRegistry;
class PanelsAdaptor;
class PanelStatusIndicator;
class WindowLocator;

/**
 * @brief Process-wide panel context
 *
 * Owns the registry, locator, layout engine and exclusivity controller for
 * one host, plus the status indicator when GlobalConfig::statusIndicator is
 * enabled. Hosts drive it through the control methods and report window
 * events through handleWindowShown() and handleWindowEntered().
 *
 * Note: This class does NOT use the singleton pattern. Create one per host
 * and pass it where needed.
 *
 * Usage:
 * @code
 * PanelManager manager(&host);
 * manager.setup(config, panels);
 * manager.toggle(QStringLiteral("tree"));
 * @endcode
 */
class PANELDOCK_EXPORT PanelManager : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(PanelManager)

public:
    /**
     * @param host Window host, must outlive the manager
     * @param scheduler Poll scheduler, nullptr to use an EventLoopScheduler
     */
    explicit PanelManager(IWindowHost* host, IScheduler* scheduler = nullptr, QObject* parent = nullptr);
    ~PanelManager() override;

    /**
     * @brief Apply a global configuration and register panels
     *
     * Invalid panels are skipped with a warning; the others are still
     * registered.
     *
     * @return The first registration error, PanelError::None if all succeeded
     */
    PanelError setup(const GlobalConfig& config, const QList<PanelConfig>& panels);

    PanelError registerPanel(const PanelConfig& panel);

    const GlobalConfig& config() const
    {
        return m_config;
    }

    // Component access
    PanelRegistry* registry() const
    {
        return m_registry.get();
    }
    WindowLocator* locator() const
    {
        return m_locator.get();
    }
    LayoutEngine* layoutEngine() const
    {
        return m_layout.get();
    }
    ExclusivityController* controller() const
    {
        return m_controller.get();
    }
    /// nullptr unless GlobalConfig::statusIndicator is enabled
    PanelStatusIndicator* statusIndicator() const
    {
        return m_statusIndicator.get();
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Control surface
    // ═══════════════════════════════════════════════════════════════════════════

    PanelError open(const QString& name);
    PanelError switchTo(const QString& name);
    PanelError close(const QString& name);
    PanelError toggle(const QString& name);
    PanelError closeSide(Edge edge);
    PanelError closeSideExcept(Edge edge, const QString& exceptName);
    PanelError closeAll();

    bool isPanel(WindowHandle window = InvalidWindow) const;

    /// Registered panel names in registration order
    QStringList listPanels() const;

    QStringList completePanelNames(const QString& prefix) const;

    // ═══════════════════════════════════════════════════════════════════════════
    // D-Bus
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Export the control surface as org.paneldock on @p bus
     *
     * Registers the service name and the object at /PanelDock. The adaptor
     * is created on first use and kept for the manager's lifetime.
     *
     * @return false if the bus is not connected or a registration failed
     */
    bool registerDBusService(QDBusConnection bus = QDBusConnection::sessionBus());

    /// Undo registerDBusService(); a no-op when not registered
    void unregisterDBusService();

    PanelsAdaptor* dbusAdaptor() const
    {
        return m_dbusAdaptor;
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Host events
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief A window started showing new content
     *
     * If the window belongs to a panel, its layout is applied. Covers panels
     * that opened themselves instead of through open()/toggle().
     *
     * @param window The window, InvalidWindow for the current window
     */
    void handleWindowShown(WindowHandle window = InvalidWindow);

    /**
     * @brief Focus entered a window
     *
     * Closes the view when only panels remain, if enabled.
     */
    void handleWindowEntered();

Q_SIGNALS:
    void activePanelChanged(PanelDock::Edge edge, const QString& name);

private:
    void updateStatusIndicator();

    IWindowHost* m_host;
    std::unique_ptr<IScheduler> m_ownedScheduler;
    IScheduler* m_scheduler;
    GlobalConfig m_config;

    std::unique_ptr<PanelRegistry> m_registry;
    std::unique_ptr<WindowLocator> m_locator;
    std::unique_ptr<LayoutEngine> m_layout;
    std::unique_ptr<ExclusivityController> m_controller;
    std::unique_ptr<PanelStatusIndicator> m_statusIndicator;

    PanelsAdaptor* m_dbusAdaptor = nullptr; // QObject child
    QString m_dbusConnectionName;
};

} // namespace PanelDock
