// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "elixi_export.h"
#include <QObject>
#include <QPointF>
#include <QPointer>
#include <functional>
#include <memory>

namespace Elixi {

/**
 * @brief Session-scoped pointer-move/pointer-up subscription
 *
 * Installs itself as an event filter on @p source when constructed and
 * removes exactly that filter on release() (or destruction). Hold it through
 * EventSubscription::Handle: resetting the handle releases the filter
 * immediately and defers the deletion, so a handle may be reset from inside
 * one of its own callbacks.
 *
 * Only events addressed to windows are forwarded. With the application
 * object as source, the same mouse event is also re-sent to every QQuickItem
 * it is delivered to; reacting to those too would report each move twice.
 */
class ELIXI_EXPORT EventSubscription : public QObject
{
    Q_OBJECT

public:
    using PointerHandler = std::function<void(const QPointF& globalPosition)>;

    struct Deleter {
        void operator()(EventSubscription* subscription) const;
    };
    using Handle = std::unique_ptr<EventSubscription, Deleter>;

    /**
     * @brief Subscribe to left-button moves and releases delivered through @p source
     * @param source Object to filter, usually the application or a window
     * @param onMove Called for every mouse move with the global position
     * @param onRelease Called for the left-button release with the global position
     */
    static Handle subscribe(QObject* source, PointerHandler onMove, PointerHandler onRelease);

    ~EventSubscription() override;

    /// Remove the filter; idempotent
    void release();
    bool isActive() const { return m_active; }

    /// Number of subscriptions currently installed, across the process
    static int activeCount();

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    EventSubscription(QObject* source, PointerHandler onMove, PointerHandler onRelease);

    QPointer<QObject> m_source;
    PointerHandler m_onMove;
    PointerHandler m_onRelease;
    bool m_active = false;
};

} // namespace Elixi
