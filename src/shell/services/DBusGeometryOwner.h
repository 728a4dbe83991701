// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../../core/interfaces.h"
#include "elixi_export.h"
#include <QDBusConnection>
#include <QString>

class QDBusMessage;

namespace Elixi {

/**
 * @brief D-Bus implementation of IGeometryOwner
 *
 * Talks to the window host service (org.elixi.WindowHost by default).
 * Queries use asyncCall with a timeout and a QDBusPendingCallWatcher, so the
 * GUI thread never blocks. Commands are sent as no-reply messages in call
 * order. Host signals are forwarded as the IGeometryOwner signals.
 *
 * Messages are built with QDBusMessage rather than a QDBusInterface, which
 * would introspect the service synchronously on construction.
 */
class ELIXI_EXPORT DBusGeometryOwner : public IGeometryOwner
{
    Q_OBJECT

public:
    DBusGeometryOwner(const QString& serviceName, const QString& objectPath, const QString& interfaceName,
                      int queryTimeoutMs, QObject* parent = nullptr);
    ~DBusGeometryOwner() override;

    void queryBounds(BoundsCallback callback) override;
    void queryDisplayBounds(BoundsCallback callback) override;

    void setPosition(const QPoint& position) override;
    void setSize(const QSize& size) override;
    void minimize() override;
    void hide() override;
    void show() override;
    void setAlwaysOnTop(bool enabled) override;
    void showContextMenu(const QPoint& globalPosition) override;

private Q_SLOTS:
    void onFocusRequested();
    void onMemoryUsageChanged(double megabytes);
    void onNotificationPosted(const QString& message);

private:
    void connectHostSignals();
    QDBusMessage createCall(const QString& method) const;
    void queryRect(const QString& method, BoundsCallback callback);
    void sendCommand(QDBusMessage message);

    QString m_serviceName;
    QString m_objectPath;
    QString m_interfaceName;
    int m_queryTimeoutMs;
    QDBusConnection m_bus;
};

} // namespace Elixi
