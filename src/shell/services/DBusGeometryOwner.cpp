// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "DBusGeometryOwner.h"
#include "../../core/constants.h"
#include "../../core/logging.h"

#include <QCoreApplication>
#include <QDBusError>
#include <QDBusMessage>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QRect>

namespace Elixi {

DBusGeometryOwner::DBusGeometryOwner(const QString& serviceName, const QString& objectPath,
                                     const QString& interfaceName, int queryTimeoutMs, QObject* parent)
    : IGeometryOwner(parent)
    , m_serviceName(serviceName)
    , m_objectPath(objectPath)
    , m_interfaceName(interfaceName)
    , m_queryTimeoutMs(queryTimeoutMs)
    , m_bus(QDBusConnection::sessionBus())
{
    connectHostSignals();
}

DBusGeometryOwner::~DBusGeometryOwner() = default;

void DBusGeometryOwner::connectHostSignals()
{
    if (!m_bus.isConnected()) {
        qCWarning(lcDbus) << "Session bus not connected - window host signals unavailable:"
                          << m_bus.lastError().message();
        return;
    }

    // Signals are matched by service/path/interface, so they connect even before the host starts
    const bool focusOk = m_bus.connect(m_serviceName, m_objectPath, m_interfaceName, DBus::Signal::FocusRequested,
                                       this, SLOT(onFocusRequested()));
    const bool memoryOk = m_bus.connect(m_serviceName, m_objectPath, m_interfaceName,
                                        DBus::Signal::MemoryUsageChanged, this, SLOT(onMemoryUsageChanged(double)));
    const bool notificationOk = m_bus.connect(m_serviceName, m_objectPath, m_interfaceName,
                                              DBus::Signal::NotificationPosted, this,
                                              SLOT(onNotificationPosted(QString)));

    if (!focusOk || !memoryOk || !notificationOk) {
        qCWarning(lcDbus) << "Failed to connect to window host signals on" << m_serviceName << m_objectPath;
    }
}

QDBusMessage DBusGeometryOwner::createCall(const QString& method) const
{
    return QDBusMessage::createMethodCall(m_serviceName, m_objectPath, m_interfaceName, method);
}

void DBusGeometryOwner::queryBounds(BoundsCallback callback)
{
    queryRect(DBus::Method::GetBounds, std::move(callback));
}

void DBusGeometryOwner::queryDisplayBounds(BoundsCallback callback)
{
    queryRect(DBus::Method::GetDisplayBounds, std::move(callback));
}

void DBusGeometryOwner::queryRect(const QString& method, BoundsCallback callback)
{
    if (!m_bus.isConnected()) {
        qCWarning(lcDbus) << "Cannot call" << method << "- session bus not connected";
        Q_EMIT errorOccurred(QCoreApplication::translate("DBusGeometryOwner", "Cannot connect to the window host"));
        callback(std::nullopt);
        return;
    }

    // Use ASYNC call so a slow host never freezes pointer handling
    QDBusPendingCall pendingCall = m_bus.asyncCall(createCall(method), m_queryTimeoutMs);
    auto* watcher = new QDBusPendingCallWatcher(pendingCall, this);

    connect(watcher, &QDBusPendingCallWatcher::finished, this,
            [this, method, callback = std::move(callback)](QDBusPendingCallWatcher* w) {
                w->deleteLater();
                QDBusPendingReply<QRect> reply = *w;
                if (!reply.isValid()) {
                    qCWarning(lcDbus) << method << "failed -" << reply.error().name() << ":"
                                      << reply.error().message();
                    Q_EMIT errorOccurred(QCoreApplication::translate("DBusGeometryOwner", "Window host query failed: %1")
                                             .arg(reply.error().message()));
                    callback(std::nullopt);
                    return;
                }

                qCDebug(lcDbus) << method << "->" << reply.value();
                callback(reply.value());
            });
}

void DBusGeometryOwner::sendCommand(QDBusMessage message)
{
    // Fire-and-forget: the host applies the latest command, no acknowledgement is awaited
    message.setNoReply(true);
    if (!m_bus.send(message)) {
        qCWarning(lcDbus) << "Failed to send" << message.member() << "to" << m_serviceName << "-"
                          << m_bus.lastError().message();
        Q_EMIT errorOccurred(QCoreApplication::translate("DBusGeometryOwner", "Cannot reach the window host"));
    }
}

void DBusGeometryOwner::setPosition(const QPoint& position)
{
    QDBusMessage msg = createCall(DBus::Method::SetPosition);
    msg << position.x() << position.y();
    sendCommand(msg);
}

void DBusGeometryOwner::setSize(const QSize& size)
{
    QDBusMessage msg = createCall(DBus::Method::SetSize);
    msg << size.width() << size.height();
    sendCommand(msg);
}

void DBusGeometryOwner::minimize()
{
    sendCommand(createCall(DBus::Method::Minimize));
}

void DBusGeometryOwner::hide()
{
    sendCommand(createCall(DBus::Method::Hide));
}

void DBusGeometryOwner::show()
{
    sendCommand(createCall(DBus::Method::Show));
}

void DBusGeometryOwner::setAlwaysOnTop(bool enabled)
{
    QDBusMessage msg = createCall(DBus::Method::SetAlwaysOnTop);
    msg << enabled;
    sendCommand(msg);
}

void DBusGeometryOwner::showContextMenu(const QPoint& globalPosition)
{
    QDBusMessage msg = createCall(DBus::Method::ShowContextMenu);
    msg << globalPosition.x() << globalPosition.y();
    sendCommand(msg);
}

void DBusGeometryOwner::onFocusRequested()
{
    qCDebug(lcDbus) << "Window host requested input focus";
    Q_EMIT focusRequested();
}

void DBusGeometryOwner::onMemoryUsageChanged(double megabytes)
{
    Q_EMIT memoryUsageChanged(megabytes);
}

void DBusGeometryOwner::onNotificationPosted(const QString& message)
{
    Q_EMIT notificationPosted(message);
}

} // namespace Elixi
