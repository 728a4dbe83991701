// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "elixishell.h"  // Generated from elixishell.kcfg via KConfigXT

#include <QString>

namespace Elixi {

/**
 * @brief Provides static access to default configuration values
 *
 * Wraps the KConfigXT-generated ElixiShellConfig class. The .kcfg file is the
 * single source of truth for defaults; this class only exposes them.
 *
 * Usage:
 *   int minWidth = ConfigDefaults::minWidth();  // Returns 300 (from .kcfg)
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Window
    // ═══════════════════════════════════════════════════════════════════════════

    static int minWidth() { return instance().defaultMinWidthValue(); }
    static int minHeight() { return instance().defaultMinHeightValue(); }
    static int maxWidth() { return instance().defaultMaxWidthValue(); }
    static int maxHeight() { return instance().defaultMaxHeightValue(); }
    static bool alwaysOnTop() { return instance().defaultAlwaysOnTopValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Placement
    // ═══════════════════════════════════════════════════════════════════════════

    static bool placementEnabled() { return instance().defaultEnabledValue(); }
    static int placementInsetX() { return instance().defaultInsetXValue(); }
    static int placementInsetY() { return instance().defaultInsetYValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Geometry owner (window host)
    // ═══════════════════════════════════════════════════════════════════════════

    static QString serviceName() { return instance().defaultServiceNameValue(); }
    static QString objectPath() { return instance().defaultObjectPathValue(); }
    static QString interfaceName() { return instance().defaultInterfaceValue(); }
    static int queryTimeoutMs() { return instance().defaultQueryTimeoutMsValue(); }

private:
    // Lazily-initialized instance, only used for its default getters
    static ElixiShellConfig& instance()
    {
        static ElixiShellConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace Elixi
