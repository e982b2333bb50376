// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "PanelManager.h"
#include "ExclusivityController.h"
#include "LayoutEngine.h"
#include "PanelRegistry.h"
#include "PanelStatusIndicator.h"
#include "WindowLocator.h"
#include "core/constants.h"
#include "core/eventloopscheduler.h"
#include "core/interfaces.h"
#include "core/logging.h"
#include "dbus/panelsadaptor.h"

#include <QDBusError>

namespace PanelDock {

PanelManager::PanelManager(IWindowHost* host, IScheduler* scheduler, QObject* parent)
    : QObject(parent)
    , m_host(host)
    , m_scheduler(scheduler)
{
    if (!m_scheduler) {
        m_ownedScheduler = std::make_unique<EventLoopScheduler>();
        m_scheduler = m_ownedScheduler.get();
    }

    m_registry = std::make_unique<PanelRegistry>();
    m_locator = std::make_unique<WindowLocator>(m_registry.get(), m_host);
    m_layout = std::make_unique<LayoutEngine>(m_host, &m_config);
    m_controller = std::make_unique<ExclusivityController>(m_registry.get(), m_locator.get(), m_layout.get(), m_host,
                                                           m_scheduler, &m_config);

    connect(m_controller.get(), &ExclusivityController::activePanelChanged, this, &PanelManager::activePanelChanged);
}

// Members are declared so that the registry outlives everything pointing into it
PanelManager::~PanelManager()
{
    unregisterDBusService();
}

PanelError PanelManager::setup(const GlobalConfig& config, const QList<PanelConfig>& panels)
{
    m_config = config;
    updateStatusIndicator();

    PanelError firstError = PanelError::None;
    int registered = 0;
    for (const PanelConfig& panel : panels) {
        const PanelError result = m_registry->registerPanel(panel);
        if (result != PanelError::None) {
            qCWarning(lcCore) << "Skipping panel" << panel.name << ":" << panelErrorToString(result);
            if (firstError == PanelError::None) {
                firstError = result;
            }
            continue;
        }
        ++registered;
    }

    qCInfo(lcCore) << "Panel setup complete:" << registered << "of" << panels.size() << "panels registered";
    return firstError;
}

PanelError PanelManager::registerPanel(const PanelConfig& panel)
{
    return m_registry->registerPanel(panel);
}

void PanelManager::updateStatusIndicator()
{
    if (m_config.statusIndicator && !m_statusIndicator) {
        m_statusIndicator = std::make_unique<PanelStatusIndicator>(m_registry.get());
        connect(m_controller.get(), &ExclusivityController::activePanelChanged, m_statusIndicator.get(),
                &PanelStatusIndicator::setActivePanel);
    } else if (!m_config.statusIndicator && m_statusIndicator) {
        m_statusIndicator.reset();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// D-Bus
// ═══════════════════════════════════════════════════════════════════════════════

bool PanelManager::registerDBusService(QDBusConnection bus)
{
    if (!bus.isConnected()) {
        qCWarning(lcDbus) << "Cannot register D-Bus service: bus" << bus.name() << "not connected";
        return false;
    }
    if (!m_dbusAdaptor) {
        m_dbusAdaptor = new PanelsAdaptor(this, this);
    }

    if (!bus.registerService(QString(DBus::ServiceName))) {
        qCCritical(lcDbus) << "Failed to register D-Bus service:" << DBus::ServiceName
                           << "Error:" << bus.lastError().message();
        return false;
    }
    if (!bus.registerObject(QString(DBus::ObjectPath), this)) {
        qCCritical(lcDbus) << "Failed to register D-Bus object:" << DBus::ObjectPath
                           << "Error:" << bus.lastError().message();
        bus.unregisterService(QString(DBus::ServiceName));
        return false;
    }

    m_dbusConnectionName = bus.name();
    qCInfo(lcDbus) << "D-Bus service registered service=" << DBus::ServiceName << "path=" << DBus::ObjectPath
                   << "interface=" << DBus::Interface;
    return true;
}

void PanelManager::unregisterDBusService()
{
    if (m_dbusConnectionName.isEmpty()) {
        return;
    }
    QDBusConnection bus(m_dbusConnectionName);
    bus.unregisterObject(QString(DBus::ObjectPath));
    bus.unregisterService(QString(DBus::ServiceName));
    m_dbusConnectionName.clear();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Control surface
// ═══════════════════════════════════════════════════════════════════════════════

PanelError PanelManager::open(const QString& name)
{
    return m_controller->open(name);
}

PanelError PanelManager::switchTo(const QString& name)
{
    return m_controller->switchTo(name);
}

PanelError PanelManager::close(const QString& name)
{
    return m_controller->close(name);
}

PanelError PanelManager::toggle(const QString& name)
{
    return m_controller->toggle(name);
}

PanelError PanelManager::closeSide(Edge edge)
{
    return m_controller->closeSide(edge);
}

PanelError PanelManager::closeSideExcept(Edge edge, const QString& exceptName)
{
    return m_controller->closeSideExcept(edge, exceptName);
}

PanelError PanelManager::closeAll()
{
    return m_controller->closeAll();
}

bool PanelManager::isPanel(WindowHandle window) const
{
    return m_locator->isPanel(window);
}

QStringList PanelManager::listPanels() const
{
    return m_registry->panelNames();
}

QStringList PanelManager::completePanelNames(const QString& prefix) const
{
    return m_registry->completePanelNames(prefix);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Host events
// ═══════════════════════════════════════════════════════════════════════════════

void PanelManager::handleWindowShown(WindowHandle window)
{
    if (!m_host) {
        return;
    }
    if (window == InvalidWindow) {
        window = m_host->currentWindow();
    }

    const QString name = m_locator->panelForWindow(window);
    if (name.isEmpty()) {
        return;
    }
    qCDebug(lcCore) << "Window" << window << "shows panel" << name;
    const PanelError result = m_controller->setupWindow(name, window);
    if (result != PanelError::None) {
        qCWarning(lcCore) << "Could not set up panel" << name << ":" << panelErrorToString(result);
    }
}

void PanelManager::handleWindowEntered()
{
    if (!m_config.closeViewWhenOnlyPanelsRemain) {
        return;
    }
    m_controller->closeViewIfOnlyPanelsRemain();
}

} // namespace PanelDock
