// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "panelsettings.h"
#include "../core/constants.h"
#include "../core/interfaces.h"
#include "../core/logging.h"
#include <KConfig>
#include <QRegularExpression>
#include <QStringList>
#include <algorithm>
#include <utility>

namespace PanelDock {

PanelSettings::PanelSettings(const QString& fileName)
    : m_config(KSharedConfig::openConfig(fileName))
{
}

PanelSettings::PanelSettings(KSharedConfigPtr config)
    : m_config(std::move(config))
{
}

void PanelSettings::reload()
{
    // KSharedConfig caches in memory
    m_config->reparseConfiguration();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

qreal PanelSettings::readValidatedSize(const KConfigGroup& group, QLatin1String key, qreal defaultValue)
{
    const qreal value = group.readEntry(key, defaultValue);
    if (!isValidPanelSize(value)) {
        qCWarning(lcConfig) << "Invalid" << key << ":" << value << "using default" << defaultValue;
        return defaultValue;
    }
    return value;
}

int PanelSettings::readValidatedInt(const KConfigGroup& group, QLatin1String key, int defaultValue, int min, int max)
{
    int value = group.readEntry(key, defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << key << ":" << value << "using default (must be" << min << "-" << max
                            << ")";
        value = defaultValue;
    }
    return value;
}

QVariant PanelSettings::parseOptionValue(const QString& value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.compare(QLatin1String("true"), Qt::CaseInsensitive) == 0) {
        return true;
    }
    if (trimmed.compare(QLatin1String("false"), Qt::CaseInsensitive) == 0) {
        return false;
    }
    return value;
}

QVariantMap PanelSettings::readOptions(const KConfigGroup& group)
{
    QVariantMap options;
    const QMap<QString, QString> entries = group.entryMap();
    for (auto it = entries.constBegin(); it != entries.constEnd(); ++it) {
        options.insert(it.key(), parseOptionValue(it.value()));
    }
    return options;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Loading
// ═══════════════════════════════════════════════════════════════════════════════

GlobalConfig PanelSettings::loadGlobalConfig() const
{
    GlobalConfig config;

    const KConfigGroup general = m_config->group(QString(ConfigKeys::GeneralGroup));
    config.leftWidth = readValidatedSize(general, ConfigKeys::LeftWidth, config.leftWidth);
    config.rightWidth = readValidatedSize(general, ConfigKeys::RightWidth, config.rightWidth);
    config.topHeight = readValidatedSize(general, ConfigKeys::TopHeight, config.topHeight);
    config.bottomHeight = readValidatedSize(general, ConfigKeys::BottomHeight, config.bottomHeight);
    config.move = general.readEntry(ConfigKeys::Move, config.move);
    config.closeViewWhenOnlyPanelsRemain =
        general.readEntry(ConfigKeys::CloseViewWhenOnlyPanelsRemain, config.closeViewWhenOnlyPanelsRemain);
    config.statusIndicator = general.readEntry(ConfigKeys::StatusIndicator, config.statusIndicator);
    config.pollIntervalMs = readValidatedInt(general, ConfigKeys::PollIntervalMs, config.pollIntervalMs,
                                             PanelDefaults::MinPollIntervalMs, PanelDefaults::MaxPollIntervalMs);
    config.closeTimeoutMs = readValidatedInt(general, ConfigKeys::CloseTimeoutMs, config.closeTimeoutMs, 0,
                                             PanelDefaults::MaxCloseTimeoutMs);

    const KConfigGroup options = m_config->group(QString(ConfigKeys::OptionsGroup));
    const QVariantMap overrides = readOptions(options);
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        config.defaultOptions.insert(it.key(), it.value());
    }

    return config;
}

QList<PanelConfig> PanelSettings::loadPanels(IWindowHost* host) const
{
    QList<PanelConfig> panels;

    const KConfigGroup panelsGroup = m_config->group(QString(ConfigKeys::PanelGroup));
    QStringList names = panelsGroup.groupList();
    std::sort(names.begin(), names.end());

    for (const QString& name : std::as_const(names)) {
        panels.append(readPanel(panelsGroup.group(name), name, host));
    }

    qCInfo(lcConfig) << "Loaded" << panels.size() << "panel definitions from" << m_config->name();
    return panels;
}

PanelConfig PanelSettings::readPanel(const KConfigGroup& group, const QString& name, IWindowHost* host) const
{
    PanelConfig panel;
    panel.name = name;

    const QString edgeName = group.readEntry(ConfigKeys::Edge, QString());
    panel.edge = edgeFromString(edgeName);
    if (panel.edge == Edge::Invalid) {
        qCWarning(lcConfig) << "Panel" << name << "has invalid edge" << edgeName;
    }

    if (group.hasKey(ConfigKeys::Size)) {
        const qreal size = group.readEntry(ConfigKeys::Size, 0.0);
        if (isValidPanelSize(size)) {
            panel.size = size;
        } else {
            qCWarning(lcConfig) << "Panel" << name << "ignoring invalid size" << size;
        }
    }
    if (group.hasKey(ConfigKeys::Move)) {
        panel.moveOverride = group.readEntry(ConfigKeys::Move, true);
    }

    panel.icon = group.readEntry(ConfigKeys::Icon, QString());
    panel.openAction = PanelAction::command(group.readEntry(ConfigKeys::OpenCommand, QString()));
    panel.closeAction = PanelAction::command(group.readEntry(ConfigKeys::CloseCommand, QString()));
    panel.exemptFrom = group.readEntry(ConfigKeys::ExemptFrom, QStringList());

    if (group.hasGroup(QString(ConfigKeys::OptionsGroup))) {
        panel.optionOverrides = readOptions(group.group(QString(ConfigKeys::OptionsGroup)));
    }

    const QStringList types = group.readEntry(ConfigKeys::MatchContentType, QStringList());
    const QString namePattern = group.readEntry(ConfigKeys::MatchContentName, QString());
    if (types.isEmpty() && namePattern.isEmpty()) {
        qCWarning(lcConfig) << "Panel" << name << "has no MatchContentType or MatchContentName";
        return panel;
    }

    const QRegularExpression nameRe(namePattern);
    if (!namePattern.isEmpty() && !nameRe.isValid()) {
        qCWarning(lcConfig) << "Panel" << name << "has invalid MatchContentName" << namePattern << ":"
                            << nameRe.errorString();
        return panel;
    }

    panel.predicate = [host, types, namePattern, nameRe](WindowHandle window) {
        if (!host) {
            return false;
        }
        if (!types.isEmpty() && !types.contains(host->contentType(window))) {
            return false;
        }
        if (!namePattern.isEmpty() && !nameRe.match(host->contentName(window)).hasMatch()) {
            return false;
        }
        return true;
    };
    return panel;
}

} // namespace PanelDock
