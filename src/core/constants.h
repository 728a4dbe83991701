// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace Elixi {

/**
 * @brief Default values for core module constants
 *
 * These defaults are used by core module files that can't depend on config.
 * For user-configurable settings, see ConfigDefaults and elixishell.kcfg.
 */
namespace Defaults {
// Window size constraints (pixels)
constexpr int MinWidth = 300;
constexpr int MinHeight = 250;
constexpr int MaxWidth = 1200;
constexpr int MaxHeight = 900;

// Initial placement inset from the bottom-right corner of the usable area
constexpr int PlacementInsetX = 650;
constexpr int PlacementInsetY = 600;

// How long a bounds query may stay unanswered before it counts as failed
constexpr int QueryTimeoutMs = 2000;
}

/**
 * @brief D-Bus member names of the window host (the geometry owner)
 *
 * The service name, object path and interface are configurable
 * (see Settings); the members are fixed by the host.
 */
namespace DBus {
namespace Method {
inline constexpr QLatin1String GetBounds{"getBounds"};
inline constexpr QLatin1String GetDisplayBounds{"getDisplayBounds"};
inline constexpr QLatin1String SetPosition{"setPosition"};
inline constexpr QLatin1String SetSize{"setSize"};
inline constexpr QLatin1String Minimize{"minimize"};
inline constexpr QLatin1String Hide{"hide"};
inline constexpr QLatin1String Show{"show"};
inline constexpr QLatin1String SetAlwaysOnTop{"setAlwaysOnTop"};
inline constexpr QLatin1String ShowContextMenu{"showContextMenu"};
}

namespace Signal {
inline constexpr QLatin1String FocusRequested{"focusRequested"};
inline constexpr QLatin1String MemoryUsageChanged{"memoryUsageChanged"};
inline constexpr QLatin1String NotificationPosted{"notificationPosted"};
}
}

/**
 * @brief Object names and properties the QML window exposes to the pointer router
 */
namespace UiKeys {
inline constexpr QLatin1String TitleBar{"titleBar"};
inline constexpr QLatin1String TitleButton{"titleButton"};
inline constexpr QLatin1String ResizeHandle{"resizeHandle"};
inline constexpr const char DirectionProperty[] = "direction";
}

} // namespace Elixi
