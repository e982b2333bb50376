// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>
#include <QtGlobal>

namespace PanelDock {

/**
 * @brief Default values for the global panel configuration
 *
 * Sizes follow the panel size rule: a value >= 1 is an absolute cell count,
 * a value below 1 is a fraction of the total columns (left/right) or
 * lines (top/bottom).
 */
namespace PanelDefaults {
constexpr qreal LeftWidth = 40;
constexpr qreal RightWidth = 40;
constexpr qreal TopHeight = 0.4;
constexpr qreal BottomHeight = 0.4;

constexpr bool Move = true;
constexpr bool CloseViewWhenOnlyPanelsRemain = false;
constexpr bool StatusIndicator = false;

// Close-completion polling
constexpr int PollIntervalMs = 30;
constexpr int MinPollIntervalMs = 1;
constexpr int MaxPollIntervalMs = 1000;
constexpr int CloseTimeoutMs = 0; // 0 = wait until the window is gone
constexpr int MaxCloseTimeoutMs = 60000;

// Range a panel can be resized to, in cells
constexpr int MinPanelCells = 1;
constexpr int MaxPanelCells = 10000;
}

/**
 * @brief Key mapping installed on panel content so 'q' closes the panel
 */
namespace CloseMapping {
inline constexpr QLatin1String Key{"q"};
inline constexpr QLatin1String Action{"<C-w>q"};
}

/**
 * @brief JSON keys for GlobalConfig serialization
 */
namespace GlobalConfigJsonKeys {
inline constexpr QLatin1String LeftWidth{"leftWidth"};
inline constexpr QLatin1String RightWidth{"rightWidth"};
inline constexpr QLatin1String TopHeight{"topHeight"};
inline constexpr QLatin1String BottomHeight{"bottomHeight"};
inline constexpr QLatin1String Move{"move"};
inline constexpr QLatin1String Options{"options"};
inline constexpr QLatin1String CloseViewWhenOnlyPanelsRemain{"closeViewWhenOnlyPanelsRemain"};
inline constexpr QLatin1String StatusIndicator{"statusIndicator"};
inline constexpr QLatin1String PollIntervalMs{"pollIntervalMs"};
inline constexpr QLatin1String CloseTimeoutMs{"closeTimeoutMs"};
}

/**
 * @brief KConfig group and key names used by PanelSettings
 */
namespace ConfigKeys {
inline constexpr QLatin1String GeneralGroup{"General"};
inline constexpr QLatin1String OptionsGroup{"Options"};
inline constexpr QLatin1String PanelGroup{"Panel"};

// [General]
inline constexpr QLatin1String LeftWidth{"LeftWidth"};
inline constexpr QLatin1String RightWidth{"RightWidth"};
inline constexpr QLatin1String TopHeight{"TopHeight"};
inline constexpr QLatin1String BottomHeight{"BottomHeight"};
inline constexpr QLatin1String Move{"Move"};
inline constexpr QLatin1String CloseViewWhenOnlyPanelsRemain{"CloseViewWhenOnlyPanelsRemain"};
inline constexpr QLatin1String StatusIndicator{"StatusIndicator"};
inline constexpr QLatin1String PollIntervalMs{"PollIntervalMs"};
inline constexpr QLatin1String CloseTimeoutMs{"CloseTimeoutMs"};

// [Panel][<name>]
inline constexpr QLatin1String Edge{"Edge"};
inline constexpr QLatin1String Size{"Size"};
inline constexpr QLatin1String Icon{"Icon"};
inline constexpr QLatin1String OpenCommand{"OpenCommand"};
inline constexpr QLatin1String CloseCommand{"CloseCommand"};
inline constexpr QLatin1String MatchContentType{"MatchContentType"};
inline constexpr QLatin1String MatchContentName{"MatchContentName"};
inline constexpr QLatin1String ExemptFrom{"ExemptFrom"};
}

/**
 * @brief D-Bus service constants
 */
namespace DBus {
inline constexpr QLatin1String ServiceName{"org.paneldock"};
inline constexpr QLatin1String ObjectPath{"/PanelDock"};
inline constexpr QLatin1String Interface{"org.paneldock.Panels"};
}

} // namespace PanelDock
