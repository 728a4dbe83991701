// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowinteractioncontroller.h"
#include "dragcontroller.h"
#include "interfaces.h"
#include "logging.h"
#include "resizecontroller.h"

#include <QPointer>

namespace Elixi {

WindowInteractionController::WindowInteractionController(IGeometryOwner* owner, const SizeConstraints& constraints,
                                                         QObject* parent)
    : QObject(parent)
    , m_owner(owner)
    , m_constraints(constraints)
{
    Q_ASSERT(m_owner);
    if (!m_constraints.isValid()) {
        qCWarning(lcSession) << "Invalid size constraints" << m_constraints.minimum << m_constraints.maximum;
    }
}

WindowInteractionController::~WindowInteractionController() = default;

bool WindowInteractionController::beginDrag(const QPoint& origin)
{
    return requestSession(origin, std::nullopt);
}

bool WindowInteractionController::beginResize(ResizeDirection direction, const QPoint& origin)
{
    return requestSession(origin, direction);
}

bool WindowInteractionController::requestSession(const QPoint& origin, std::optional<ResizeDirection> direction)
{
    // One session at a time; a second press is a no-op, not a restart
    if (!m_session.isIdle() || m_pending) {
        qCDebug(lcSession) << "Ignoring session request - already" << toString(m_session.kind())
                           << (m_pending ? "(handshake pending)" : "");
        return false;
    }

    const quint64 generation = ++m_generation;
    m_pending = PendingStart{generation, origin, direction};

    qCDebug(lcSession) << "Requesting baseline for" << (direction ? "resize" : "drag") << "at" << origin;

    // The owner may answer synchronously (bus down), so m_pending must be set first
    QPointer<WindowInteractionController> self(this);
    m_owner->queryBounds([self, generation](const std::optional<WindowBounds>& bounds) {
        if (self) {
            self->onBaselineReceived(generation, bounds);
        }
    });

    return m_pending.has_value() || !m_session.isIdle();
}

void WindowInteractionController::onBaselineReceived(quint64 generation, const std::optional<WindowBounds>& bounds)
{
    if (!m_pending || m_pending->generation != generation) {
        qCDebug(lcSession) << "Ignoring stale bounds reply, generation" << generation;
        return;
    }

    const PendingStart pending = *m_pending;
    m_pending.reset();

    if (!bounds) {
        qCWarning(lcSession) << "Bounds query failed - staying idle";
        Q_EMIT handshakeFailed();
        return;
    }

    bool started = false;
    if (pending.direction) {
        started = m_session.beginResize(*pending.direction, pending.origin, *bounds);
    } else {
        started = m_session.beginDrag(pending.origin, *bounds);
    }

    if (!started) {
        return;
    }

    qCInfo(lcSession) << toString(m_session.kind()) << "started - baseline" << *bounds
                      << (pending.direction ? ResizeDirections::toToken(*pending.direction) : QString());
    Q_EMIT sessionStarted(m_session.kind());
    Q_EMIT sessionChanged();
}

void WindowInteractionController::pointerMoved(const QPoint& position)
{
    if (const DragState* drag = m_session.drag()) {
        m_owner->setPosition(DragController::targetPosition(*drag, position));
        return;
    }

    if (const ResizeState* resize = m_session.resize()) {
        m_owner->setSize(ResizeController::targetSize(*resize, position, m_constraints));
        return;
    }

    if (m_pending) {
        qCDebug(lcSession) << "Dropping pointer move at" << position << "- baseline not received yet";
    }
}

void WindowInteractionController::pointerReleased()
{
    if (m_pending) {
        qCDebug(lcSession) << "Pointer released before baseline arrived - cancelling handshake";
        m_pending.reset();
    }

    if (m_session.isIdle()) {
        return;
    }

    qCInfo(lcSession) << toString(m_session.kind()) << "ended";
    m_session.end();
    Q_EMIT sessionEnded();
    Q_EMIT sessionChanged();
}

} // namespace Elixi
