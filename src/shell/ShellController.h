// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "elixi_export.h"
#include <QObject>
#include <QPointF>
#include <QString>

namespace Elixi {

class IGeometryOwner;

/**
 * @brief Window chrome state and commands for the QML shell
 *
 * Title buttons, the context menu and the host push signals that do not
 * affect geometry. Everything is forwarded to the geometry owner.
 */
class ELIXI_EXPORT ShellController : public QObject
{
    Q_OBJECT

    Q_PROPERTY(QString title READ title NOTIFY titleChanged)
    Q_PROPERTY(bool backgroundMode READ backgroundMode WRITE setBackgroundMode NOTIFY backgroundModeChanged)
    Q_PROPERTY(bool alwaysOnTop READ alwaysOnTop NOTIFY alwaysOnTopChanged)
    Q_PROPERTY(QString memoryText READ memoryText NOTIFY memoryTextChanged)

public:
    ShellController(IGeometryOwner* owner, bool alwaysOnTop, QObject* parent = nullptr);

    QString title() const;
    bool backgroundMode() const { return m_backgroundMode; }
    void setBackgroundMode(bool enabled);
    bool alwaysOnTop() const { return m_alwaysOnTop; }
    QString memoryText() const { return m_memoryText; }

    /// "~N MB", rounded; empty for negative input
    static QString formatMemory(double megabytes);

    Q_INVOKABLE void minimize();
    /// Close button: hides, the backend keeps running
    Q_INVOKABLE void hideWindow();
    Q_INVOKABLE void toggleAlwaysOnTop();
    Q_INVOKABLE void showContextMenu(const QPointF& globalPosition);

Q_SIGNALS:
    void titleChanged();
    void backgroundModeChanged();
    void alwaysOnTopChanged();
    void memoryTextChanged();
    void focusInputRequested();
    void notificationReceived(const QString& message);

private Q_SLOTS:
    void onFocusRequested();
    void onMemoryUsageChanged(double megabytes);

private:
    IGeometryOwner* m_owner;
    bool m_alwaysOnTop;
    bool m_backgroundMode = false;
    QString m_memoryText;
};

} // namespace Elixi
