// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interactionsession.h"
#include "logging.h"

namespace Elixi {

InteractionSession::Kind InteractionSession::kind() const
{
    if (isDragging()) {
        return Kind::Dragging;
    }
    if (isResizing()) {
        return Kind::Resizing;
    }
    return Kind::Idle;
}

bool InteractionSession::beginDrag(const QPoint& origin, const WindowBounds& baseline)
{
    if (!isIdle()) {
        qCDebug(lcSession) << "Rejecting drag start while" << toString(kind());
        return false;
    }
    m_state = DragState{origin, baseline};
    return true;
}

bool InteractionSession::beginResize(ResizeDirection direction, const QPoint& origin, const WindowBounds& baseline)
{
    if (!isIdle()) {
        qCDebug(lcSession) << "Rejecting resize start while" << toString(kind());
        return false;
    }
    m_state = ResizeState{origin, baseline, direction};
    return true;
}

void InteractionSession::end()
{
    m_state = IdleState{};
}

const char* toString(InteractionSession::Kind kind)
{
    switch (kind) {
    case InteractionSession::Kind::Idle:
        return "Idle";
    case InteractionSession::Kind::Dragging:
        return "Dragging";
    case InteractionSession::Kind::Resizing:
        return "Resizing";
    }
    return "Unknown";
}

} // namespace Elixi
