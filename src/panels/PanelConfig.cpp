// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "PanelConfig.h"
#include <QRegularExpression>

namespace PanelDock {

bool PanelConfig::keepsOpen(const QString& otherName) const
{
    for (const QString& pattern : exemptFrom) {
        const QRegularExpression re(pattern);
        if (re.isValid() && re.match(otherName).hasMatch()) {
            return true;
        }
    }
    return false;
}

bool PanelConfig::hasValidExemptPatterns(QString* invalidPattern) const
{
    for (const QString& pattern : exemptFrom) {
        if (pattern.isEmpty() || !QRegularExpression(pattern).isValid()) {
            if (invalidPattern) {
                *invalidPattern = pattern;
            }
            return false;
        }
    }
    return true;
}

} // namespace PanelDock
