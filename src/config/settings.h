// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/windowbounds.h"
#include "elixi_export.h"
#include <KSharedConfig>
#include <QSize>
#include <QString>

class KConfigGroup;

namespace Elixi {

/**
 * @brief Shell configuration read from elixishellrc
 *
 * Values outside their range fall back to the .kcfg default with a warning.
 * A min/max pair that contradicts itself replaces the whole constraint set
 * with the defaults.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class ELIXI_EXPORT Settings
{
public:
    /// Reads the default elixishellrc
    Settings();
    /// Reads @p config; used by tests with a temporary file
    explicit Settings(KSharedConfig::Ptr config);

    /// Re-read everything from disk
    void load();

    SizeConstraints sizeConstraints() const { return m_sizeConstraints; }
    bool alwaysOnTop() const { return m_alwaysOnTop; }

    bool placementEnabled() const { return m_placementEnabled; }
    void setPlacementEnabled(bool enabled) { m_placementEnabled = enabled; }
    QSize placementInset() const { return m_placementInset; }

    QString serviceName() const { return m_serviceName; }
    void setServiceName(const QString& serviceName) { m_serviceName = serviceName; }
    QString objectPath() const { return m_objectPath; }
    QString interfaceName() const { return m_interfaceName; }
    int queryTimeoutMs() const { return m_queryTimeoutMs; }

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);
    static QString readNonEmptyString(const KConfigGroup& group, const char* key, const QString& defaultValue,
                                      const char* settingName);

    KSharedConfig::Ptr m_config;

    SizeConstraints m_sizeConstraints;
    bool m_alwaysOnTop = true;
    bool m_placementEnabled = true;
    QSize m_placementInset;
    QString m_serviceName;
    QString m_objectPath;
    QString m_interfaceName;
    int m_queryTimeoutMs = 0;
};

} // namespace Elixi
