// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "paneldock_export.h"
#include "../panels/GlobalConfig.h"
#include "../panels/PanelConfig.h"
#include <KConfigGroup>
#include <KSharedConfig>
#include <QList>
#include <QString>

namespace PanelDock {

class IWindowHost;

/**
 * @brief Loads the panel setup from a KConfig file
 *
 * File layout:
 * @code
 * [General]
 * LeftWidth=30
 * TopHeight=0.3
 *
 * [Options]
 * number=false
 *
 * [Panel][tree]
 * Edge=left
 * OpenCommand=FileTreeOpen
 * MatchContentType=filetree
 *
 * [Panel][tree][Options]
 * signcolumn=yes
 * @endcode
 *
 * Panels defined in a file always use command actions. Their window is
 * found with a predicate built from MatchContentType (any of the listed
 * types) and MatchContentName (regular expression); when both are given
 * both must match.
 */
class PANELDOCK_EXPORT PanelSettings
{
public:
    /// Open a config file by name, resolved like KSharedConfig::openConfig()
    explicit PanelSettings(const QString& fileName = QStringLiteral("paneldockrc"));
    explicit PanelSettings(KSharedConfigPtr config);

    /// Re-read the file from disk
    void reload();

    /**
     * @brief Read [General] and [Options]
     *
     * Invalid values are replaced by their defaults with a warning.
     */
    GlobalConfig loadGlobalConfig() const;

    /**
     * @brief Read all [Panel][<name>] groups, sorted by name
     *
     * Problems are logged but the panel is still returned, so that
     * registration reports it as invalid.
     *
     * @param host Host queried by the generated predicates
     */
    QList<PanelConfig> loadPanels(IWindowHost* host) const;

    /// Convert a string option value, "true"/"false" become booleans
    static QVariant parseOptionValue(const QString& value);

private:
    PanelConfig readPanel(const KConfigGroup& group, const QString& name, IWindowHost* host) const;
    static QVariantMap readOptions(const KConfigGroup& group);
    static qreal readValidatedSize(const KConfigGroup& group, QLatin1String key, qreal defaultValue);
    static int readValidatedInt(const KConfigGroup& group, QLatin1String key, int defaultValue, int min, int max);

    KSharedConfigPtr m_config;
};

} // namespace PanelDock
