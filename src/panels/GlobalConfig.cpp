// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "GlobalConfig.h"
#include "core/constants.h"
#include "core/logging.h"
#include <QtMath>
#include <algorithm>

namespace PanelDock {

// Use shared JSON keys from constants.h
using namespace GlobalConfigJsonKeys;

namespace {
qreal readPositiveSize(const QJsonObject& json, QLatin1String key, qreal fallback)
{
    if (!json.contains(key)) {
        return fallback;
    }
    const qreal value = json[key].toDouble(fallback);
    if (!isValidPanelSize(value)) {
        qCWarning(lcConfig) << "Ignoring invalid size for" << key << ":" << value;
        return fallback;
    }
    return value;
}
} // anonymous namespace

qreal GlobalConfig::defaultSizeForEdge(Edge edge) const
{
    switch (edge) {
    case Edge::Left:
        return leftWidth;
    case Edge::Right:
        return rightWidth;
    case Edge::Top:
        return topHeight;
    case Edge::Bottom:
        return bottomHeight;
    case Edge::Invalid:
        break;
    }
    return 0;
}

bool GlobalConfig::operator==(const GlobalConfig& other) const
{
    // Use qFuzzyCompare properly (add 1.0 for values that could be near zero)
    return qFuzzyCompare(1.0 + leftWidth, 1.0 + other.leftWidth)
        && qFuzzyCompare(1.0 + rightWidth, 1.0 + other.rightWidth)
        && qFuzzyCompare(1.0 + topHeight, 1.0 + other.topHeight)
        && qFuzzyCompare(1.0 + bottomHeight, 1.0 + other.bottomHeight)
        && move == other.move
        && defaultOptions == other.defaultOptions
        && closeViewWhenOnlyPanelsRemain == other.closeViewWhenOnlyPanelsRemain
        && statusIndicator == other.statusIndicator
        && pollIntervalMs == other.pollIntervalMs
        && closeTimeoutMs == other.closeTimeoutMs;
}

bool GlobalConfig::operator!=(const GlobalConfig& other) const
{
    return !(*this == other);
}

QJsonObject GlobalConfig::toJson() const
{
    QJsonObject json;
    json[LeftWidth] = leftWidth;
    json[RightWidth] = rightWidth;
    json[TopHeight] = topHeight;
    json[BottomHeight] = bottomHeight;
    json[GlobalConfigJsonKeys::Move] = move;
    json[Options] = QJsonObject::fromVariantMap(defaultOptions);
    json[GlobalConfigJsonKeys::CloseViewWhenOnlyPanelsRemain] = closeViewWhenOnlyPanelsRemain;
    json[GlobalConfigJsonKeys::StatusIndicator] = statusIndicator;
    json[GlobalConfigJsonKeys::PollIntervalMs] = pollIntervalMs;
    json[GlobalConfigJsonKeys::CloseTimeoutMs] = closeTimeoutMs;
    return json;
}

GlobalConfig GlobalConfig::fromJson(const QJsonObject& json)
{
    GlobalConfig config;

    config.leftWidth = readPositiveSize(json, LeftWidth, config.leftWidth);
    config.rightWidth = readPositiveSize(json, RightWidth, config.rightWidth);
    config.topHeight = readPositiveSize(json, TopHeight, config.topHeight);
    config.bottomHeight = readPositiveSize(json, BottomHeight, config.bottomHeight);

    if (json.contains(GlobalConfigJsonKeys::Move)) {
        config.move = json[GlobalConfigJsonKeys::Move].toBool(config.move);
    }
    if (json.contains(Options)) {
        const QVariantMap overrides = json[Options].toObject().toVariantMap();
        for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
            config.defaultOptions.insert(it.key(), it.value());
        }
    }
    if (json.contains(GlobalConfigJsonKeys::CloseViewWhenOnlyPanelsRemain)) {
        config.closeViewWhenOnlyPanelsRemain =
            json[GlobalConfigJsonKeys::CloseViewWhenOnlyPanelsRemain].toBool(config.closeViewWhenOnlyPanelsRemain);
    }
    if (json.contains(GlobalConfigJsonKeys::StatusIndicator)) {
        config.statusIndicator = json[GlobalConfigJsonKeys::StatusIndicator].toBool(config.statusIndicator);
    }
    if (json.contains(GlobalConfigJsonKeys::PollIntervalMs)) {
        config.pollIntervalMs = json[GlobalConfigJsonKeys::PollIntervalMs].toInt(config.pollIntervalMs);
        config.pollIntervalMs = std::clamp(config.pollIntervalMs, PanelDefaults::MinPollIntervalMs, PanelDefaults::MaxPollIntervalMs);
    }
    if (json.contains(GlobalConfigJsonKeys::CloseTimeoutMs)) {
        config.closeTimeoutMs = json[GlobalConfigJsonKeys::CloseTimeoutMs].toInt(config.closeTimeoutMs);
        config.closeTimeoutMs = std::clamp(config.closeTimeoutMs, 0, PanelDefaults::MaxCloseTimeoutMs);
    }

    return config;
}

QVariantMap GlobalConfig::builtinOptions()
{
    return {
        {QStringLiteral("winfixwidth"), false},
        {QStringLiteral("winfixheight"), false},
        {QStringLiteral("number"), false},
        {QStringLiteral("foldcolumn"), QStringLiteral("0")},
        {QStringLiteral("signcolumn"), QStringLiteral("no")},
        {QStringLiteral("colorcolumn"), QStringLiteral("0")},
        {QStringLiteral("bufhidden"), QStringLiteral("hide")},
        {QStringLiteral("buflisted"), false},
    };
}

} // namespace PanelDock
