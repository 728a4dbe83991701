// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "EventSubscription.h"
#include "../core/logging.h"

#include <QEvent>
#include <QMouseEvent>

namespace Elixi {

namespace {
int s_activeSubscriptions = 0;
}

void EventSubscription::Deleter::operator()(EventSubscription* subscription) const
{
    if (subscription) {
        subscription->release();
        subscription->deleteLater();
    }
}

EventSubscription::Handle EventSubscription::subscribe(QObject* source, PointerHandler onMove, PointerHandler onRelease)
{
    if (!source) {
        qCWarning(lcShell) << "Cannot subscribe to pointer events - no event source";
        return Handle();
    }
    return Handle(new EventSubscription(source, std::move(onMove), std::move(onRelease)));
}

EventSubscription::EventSubscription(QObject* source, PointerHandler onMove, PointerHandler onRelease)
    : QObject(nullptr)
    , m_source(source)
    , m_onMove(std::move(onMove))
    , m_onRelease(std::move(onRelease))
{
    m_source->installEventFilter(this);
    m_active = true;
    ++s_activeSubscriptions;
    qCDebug(lcShell) << "Pointer subscription installed, active:" << s_activeSubscriptions;
}

EventSubscription::~EventSubscription()
{
    release();
}

void EventSubscription::release()
{
    if (!m_active) {
        return;
    }
    m_active = false;
    --s_activeSubscriptions;

    if (m_source) {
        m_source->removeEventFilter(this);
    }
    qCDebug(lcShell) << "Pointer subscription released, active:" << s_activeSubscriptions;
}

int EventSubscription::activeCount()
{
    return s_activeSubscriptions;
}

bool EventSubscription::eventFilter(QObject* watched, QEvent* event)
{
    if (!m_active || !watched || !watched->isWindowType()) {
        return false;
    }

    switch (event->type()) {
    case QEvent::MouseMove: {
        const auto* mouseEvent = static_cast<QMouseEvent*>(event);
        if (m_onMove) {
            m_onMove(mouseEvent->globalPosition());
        }
        break;
    }
    case QEvent::MouseButtonRelease: {
        const auto* mouseEvent = static_cast<QMouseEvent*>(event);
        if (mouseEvent->button() == Qt::LeftButton && m_onRelease) {
            // The handler usually resets our handle; Deleter defers the delete
            m_onRelease(mouseEvent->globalPosition());
        }
        break;
    }
    default:
        break;
    }

    // Observe only; the window and its items still get the event
    return false;
}

} // namespace Elixi
