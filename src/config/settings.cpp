// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include <KConfig>
#include <KConfigGroup>

namespace Elixi {

namespace {
// Sanity range for any window dimension read from disk
constexpr int MinDimension = 50;
constexpr int MaxDimension = 10000;
}

Settings::Settings()
    : Settings(KSharedConfig::openConfig(QStringLiteral("elixishellrc")))
{
}

Settings::Settings(KSharedConfig::Ptr config)
    : m_config(std::move(config))
{
    load();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

QString Settings::readNonEmptyString(const KConfigGroup& group, const char* key, const QString& defaultValue,
                                     const char* settingName)
{
    QString value = group.readEntry(QLatin1String(key), defaultValue).trimmed();
    if (value.isEmpty()) {
        qCWarning(lcConfig) << "Empty" << settingName << "- using default" << defaultValue;
        value = defaultValue;
    }
    return value;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Load
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::load()
{
    // KSharedConfig caches in memory; pick up edits made since the last load
    m_config->reparseConfiguration();

    KConfigGroup window = m_config->group(QStringLiteral("Window"));
    KConfigGroup placement = m_config->group(QStringLiteral("Placement"));
    KConfigGroup owner = m_config->group(QStringLiteral("GeometryOwner"));

    // Window constraints (defaults from .kcfg via ConfigDefaults)
    SizeConstraints constraints;
    constraints.minimum = QSize(
        readValidatedInt(window, "MinWidth", ConfigDefaults::minWidth(), MinDimension, MaxDimension, "minimum width"),
        readValidatedInt(window, "MinHeight", ConfigDefaults::minHeight(), MinDimension, MaxDimension,
                         "minimum height"));
    constraints.maximum = QSize(
        readValidatedInt(window, "MaxWidth", ConfigDefaults::maxWidth(), MinDimension, MaxDimension, "maximum width"),
        readValidatedInt(window, "MaxHeight", ConfigDefaults::maxHeight(), MinDimension, MaxDimension,
                         "maximum height"));

    if (!constraints.isValid()) {
        qCWarning(lcConfig) << "Window size constraints contradict each other: min" << constraints.minimum << "max"
                            << constraints.maximum << "- using defaults";
        constraints = SizeConstraints{QSize(ConfigDefaults::minWidth(), ConfigDefaults::minHeight()),
                                      QSize(ConfigDefaults::maxWidth(), ConfigDefaults::maxHeight())};
    }
    m_sizeConstraints = constraints;
    m_alwaysOnTop = window.readEntry(QLatin1String("AlwaysOnTop"), ConfigDefaults::alwaysOnTop());

    // Placement
    m_placementEnabled = placement.readEntry(QLatin1String("Enabled"), ConfigDefaults::placementEnabled());
    m_placementInset = QSize(
        readValidatedInt(placement, "InsetX", ConfigDefaults::placementInsetX(), 0, MaxDimension, "placement inset x"),
        readValidatedInt(placement, "InsetY", ConfigDefaults::placementInsetY(), 0, MaxDimension, "placement inset y"));

    // Geometry owner
    m_serviceName = readNonEmptyString(owner, "ServiceName", ConfigDefaults::serviceName(), "service name");
    m_objectPath = readNonEmptyString(owner, "ObjectPath", ConfigDefaults::objectPath(), "object path");
    m_interfaceName = readNonEmptyString(owner, "Interface", ConfigDefaults::interfaceName(), "interface name");
    m_queryTimeoutMs =
        readValidatedInt(owner, "QueryTimeoutMs", ConfigDefaults::queryTimeoutMs(), 100, 30000, "query timeout");

    qCDebug(lcConfig) << "Settings loaded: constraints" << m_sizeConstraints.minimum << m_sizeConstraints.maximum
                      << "service" << m_serviceName << "placement" << m_placementEnabled;
}

} // namespace Elixi
