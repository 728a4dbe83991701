// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "EventSubscription.h"
#include "elixi_export.h"
#include <QList>
#include <QObject>
#include <QPointF>
#include <QPointer>
#include <QString>

class QQuickItem;

namespace Elixi {

class WindowInteractionController;

/**
 * @brief Binds pointer input of the shell window to the interaction controller
 *
 * Responsible for:
 * - Starting a drag on a left press over the title region, except over
 *   title buttons (minimize, close, pin)
 * - Starting a resize on a left press over a handle, with the direction
 *   read from the handle's "direction" property at press time
 * - Holding one pointer-move/pointer-up subscription per session and
 *   releasing exactly that subscription when the session ends
 *
 * Presses while a session or handshake is active are no-ops.
 */
class ELIXI_EXPORT PointerEventRouter : public QObject
{
    Q_OBJECT

public:
    explicit PointerEventRouter(WindowInteractionController* controller, QObject* parent = nullptr);
    ~PointerEventRouter() override;

    /**
     * @brief Register the title bar, title buttons and handles found under @p root
     *
     * Items are matched by objectName: "titleBar", "titleButton" and
     * "resizeHandle". Missing title bar or handles are logged, not fatal.
     */
    void attach(QObject* root);

    void registerTitleRegion(QQuickItem* item);
    void registerTitleButton(QQuickItem* item);
    void registerHandle(QQuickItem* item);

    /**
     * @brief Object whose events feed the session subscription
     *
     * Defaults to the application object, so moves and the release are seen
     * even when the pointer leaves the window mid-drag.
     */
    void setEventSource(QObject* source);

    /// Start a drag for a press reported at @p globalPosition
    Q_INVOKABLE bool pressTitle(const QPointF& globalPosition);

    /// Start a resize for a press on the handle carrying @p direction
    Q_INVOKABLE bool pressHandle(const QString& direction, const QPointF& globalPosition);

    bool hasSessionSubscription() const { return static_cast<bool>(m_subscription); }

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    bool isOverTitleButton(const QPointF& scenePosition) const;
    void subscribeSession();
    void releaseSession();
    void onPointerMoved(const QPointF& globalPosition);
    void onPointerReleased(const QPointF& globalPosition);

    WindowInteractionController* m_controller;
    QPointer<QObject> m_eventSource;

    QList<QPointer<QQuickItem>> m_titleRegions;
    QList<QPointer<QQuickItem>> m_titleButtons;
    QList<QPointer<QQuickItem>> m_handles;

    EventSubscription::Handle m_subscription;
};

} // namespace Elixi
