// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "PanelAction.h"
#include "core/interfaces.h"
#include "core/logging.h"

namespace PanelDock {

PanelAction PanelAction::command(const QString& command)
{
    PanelAction action;
    if (command.isEmpty()) {
        return action;
    }
    action.m_kind = Kind::Command;
    action.m_command = command;
    return action;
}

PanelAction PanelAction::callback(std::function<void()> callback)
{
    PanelAction action;
    if (!callback) {
        return action;
    }
    action.m_kind = Kind::Callback;
    action.m_callback = std::move(callback);
    return action;
}

bool PanelAction::invoke(IWindowHost* host) const
{
    switch (m_kind) {
    case Kind::Command:
        if (!host) {
            qCWarning(lcCore) << "PanelAction: no host to run command" << m_command;
            return false;
        }
        host->executeCommand(m_command);
        return true;
    case Kind::Callback:
        m_callback();
        return true;
    case Kind::None:
        break;
    }
    return false;
}

} // namespace PanelDock
