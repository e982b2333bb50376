// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include <QString>
#include <functional>

namespace PanelDock {

class IWindowHost;

/**
 * @brief Open or close behavior of a panel
 *
 * Either a host command passed verbatim to IWindowHost::executeCommand(),
 * or an arbitrary callback. A default-constructed action is null.
 *
 * Callbacks are not wrapped: if one throws, the exception propagates to the
 * caller of invoke().
 */
class PANELDOCK_EXPORT PanelAction
{
public:
    enum class Kind {
        None, ///< No action configured
        Command, ///< Host command string
        Callback ///< std::function callback
    };

    PanelAction() = default;

    static PanelAction command(const QString& command);
    static PanelAction callback(std::function<void()> callback);

    Kind kind() const noexcept
    {
        return m_kind;
    }
    bool isNull() const noexcept
    {
        return m_kind == Kind::None;
    }

    /// The command text for Kind::Command, empty otherwise
    QString commandText() const
    {
        return m_command;
    }

    /**
     * @brief Run the action
     * @param host Host used for Kind::Command
     * @return false if the action is null or a command has no host
     */
    bool invoke(IWindowHost* host) const;

private:
    Kind m_kind = Kind::None;
    QString m_command;
    std::function<void()> m_callback;
};

} // namespace PanelDock
