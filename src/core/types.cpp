// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"
#include "constants.h"

#include <QtMath>
#include <QtNumeric>

namespace PanelDock {

bool isValidPanelSize(qreal value)
{
    return qIsFinite(value) && value > 0 && value <= PanelDefaults::MaxPanelCells;
}

QString edgeToString(Edge edge)
{
    switch (edge) {
    case Edge::Left:
        return QStringLiteral("left");
    case Edge::Right:
        return QStringLiteral("right");
    case Edge::Top:
        return QStringLiteral("top");
    case Edge::Bottom:
        return QStringLiteral("bottom");
    case Edge::Invalid:
        break;
    }
    return QString();
}

Edge edgeFromString(const QString& name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String("left")) {
        return Edge::Left;
    }
    if (normalized == QLatin1String("right")) {
        return Edge::Right;
    }
    if (normalized == QLatin1String("top")) {
        return Edge::Top;
    }
    if (normalized == QLatin1String("bottom")) {
        return Edge::Bottom;
    }
    return Edge::Invalid;
}

QString panelErrorToString(PanelError error)
{
    switch (error) {
    case PanelError::None:
        return QStringLiteral("no error");
    case PanelError::InvalidConfig:
        return QStringLiteral("invalid panel configuration");
    case PanelError::UnknownPanel:
        return QStringLiteral("unknown panel");
    case PanelError::CloseTimeout:
        return QStringLiteral("timed out waiting for panel to close");
    }
    return QStringLiteral("unknown error");
}

} // namespace PanelDock
