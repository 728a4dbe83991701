// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "PointerEventRouter.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/windowinteractioncontroller.h"

#include <QCoreApplication>
#include <QMouseEvent>
#include <QQuickItem>

namespace Elixi {

PointerEventRouter::PointerEventRouter(WindowInteractionController* controller, QObject* parent)
    : QObject(parent)
    , m_controller(controller)
    , m_eventSource(QCoreApplication::instance())
{
    Q_ASSERT(m_controller);

    // A failed handshake never reaches Resizing/Dragging; drop the subscription now
    // instead of waiting for the release
    connect(m_controller, &WindowInteractionController::handshakeFailed, this, [this]() {
        releaseSession();
    });
}

PointerEventRouter::~PointerEventRouter()
{
    releaseSession();
}

void PointerEventRouter::attach(QObject* root)
{
    if (!root) {
        qCWarning(lcShell) << "Cannot attach pointer router - no root object";
        return;
    }

    const auto items = root->findChildren<QQuickItem*>();
    for (QQuickItem* item : items) {
        const QString name = item->objectName();
        if (name == UiKeys::TitleBar) {
            registerTitleRegion(item);
        } else if (name == UiKeys::TitleButton) {
            registerTitleButton(item);
        } else if (name == UiKeys::ResizeHandle) {
            registerHandle(item);
        }
    }

    if (m_titleRegions.isEmpty()) {
        qCWarning(lcShell) << "No title bar found - window cannot be dragged";
    }
    if (m_handles.isEmpty()) {
        qCWarning(lcShell) << "No resize handles found - window cannot be resized";
    }
    qCInfo(lcShell) << "Pointer router attached -" << m_titleRegions.size() << "title regions,"
                    << m_titleButtons.size() << "title buttons," << m_handles.size() << "handles";
}

void PointerEventRouter::registerTitleRegion(QQuickItem* item)
{
    if (!item) {
        return;
    }
    m_titleRegions.append(item);
    item->installEventFilter(this);
}

void PointerEventRouter::registerTitleButton(QQuickItem* item)
{
    if (!item) {
        return;
    }
    // Only used for hit testing, no filter needed
    m_titleButtons.append(item);
}

void PointerEventRouter::registerHandle(QQuickItem* item)
{
    if (!item) {
        return;
    }
    m_handles.append(item);
    item->installEventFilter(this);
}

void PointerEventRouter::setEventSource(QObject* source)
{
    m_eventSource = source;
}

bool PointerEventRouter::pressTitle(const QPointF& globalPosition)
{
    if (!m_controller->beginDrag(globalPosition.toPoint())) {
        return false;
    }
    subscribeSession();
    return true;
}

bool PointerEventRouter::pressHandle(const QString& direction, const QPointF& globalPosition)
{
    const auto parsed = ResizeDirections::fromToken(direction);
    if (!parsed) {
        qCDebug(lcShell) << "Ignoring press on handle with unknown direction" << direction;
        return false;
    }

    if (!m_controller->beginResize(*parsed, globalPosition.toPoint())) {
        return false;
    }
    subscribeSession();
    return true;
}

bool PointerEventRouter::eventFilter(QObject* watched, QEvent* event)
{
    if (event->type() != QEvent::MouseButtonPress) {
        return false;
    }

    const auto* mouseEvent = static_cast<QMouseEvent*>(event);
    if (mouseEvent->button() != Qt::LeftButton) {
        return false;
    }

    auto* item = qobject_cast<QQuickItem*>(watched);
    if (!item) {
        return false;
    }

    if (m_handles.contains(item)) {
        const QString direction = item->property(UiKeys::DirectionProperty).toString();
        pressHandle(direction, mouseEvent->globalPosition());
    } else if (m_titleRegions.contains(item)) {
        if (isOverTitleButton(mouseEvent->scenePosition())) {
            qCDebug(lcShell) << "Press on title button - not starting a drag";
            return false;
        }
        pressTitle(mouseEvent->globalPosition());
    }

    // Let the item handle the press as well (cursor shape, grab)
    return false;
}

bool PointerEventRouter::isOverTitleButton(const QPointF& scenePosition) const
{
    for (const auto& button : m_titleButtons) {
        if (button && button->isVisible() && button->contains(button->mapFromScene(scenePosition))) {
            return true;
        }
    }
    return false;
}

void PointerEventRouter::subscribeSession()
{
    if (m_subscription) {
        return;
    }

    m_subscription = EventSubscription::subscribe(
        m_eventSource,
        [this](const QPointF& globalPosition) {
            onPointerMoved(globalPosition);
        },
        [this](const QPointF& globalPosition) {
            onPointerReleased(globalPosition);
        });
}

void PointerEventRouter::releaseSession()
{
    m_subscription.reset();
}

void PointerEventRouter::onPointerMoved(const QPointF& globalPosition)
{
    m_controller->pointerMoved(globalPosition.toPoint());
}

void PointerEventRouter::onPointerReleased(const QPointF& globalPosition)
{
    Q_UNUSED(globalPosition)
    m_controller->pointerReleased();
    releaseSession();
}

} // namespace Elixi
