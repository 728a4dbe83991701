// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "elixi_export.h"
#include "windowbounds.h"
#include <QPoint>
#include <variant>

namespace Elixi {

/// No pointer interaction in progress
struct IdleState {
};

/// Title-bar drag; origin is the global pointer position at press
struct DragState {
    QPoint origin;
    WindowBounds baseline;
};

/// Handle resize; origin is the global pointer position at press
struct ResizeState {
    QPoint origin;
    WindowBounds baseline;
    ResizeDirection direction;
};

/**
 * @brief The single live pointer session of the shell window
 *
 * Idle | Dragging | Resizing, held as one variant so that a drag and a
 * resize can never be active together. Transitions out of Idle are only
 * accepted from Idle; end() always returns to Idle.
 *
 * Pure value type: no Qt event or D-Bus dependency, so the state machine
 * can be driven with synthetic coordinates.
 */
class ELIXI_EXPORT InteractionSession
{
public:
    enum class Kind {
        Idle,
        Dragging,
        Resizing
    };

    Kind kind() const;
    bool isIdle() const { return std::holds_alternative<IdleState>(m_state); }
    bool isDragging() const { return std::holds_alternative<DragState>(m_state); }
    bool isResizing() const { return std::holds_alternative<ResizeState>(m_state); }

    /// nullptr unless dragging
    const DragState* drag() const { return std::get_if<DragState>(&m_state); }
    /// nullptr unless resizing
    const ResizeState* resize() const { return std::get_if<ResizeState>(&m_state); }

    /**
     * @brief Idle -> Dragging
     * @return false (state unchanged) if a session is already active
     */
    bool beginDrag(const QPoint& origin, const WindowBounds& baseline);

    /**
     * @brief Idle -> Resizing
     * @return false (state unchanged) if a session is already active
     */
    bool beginResize(ResizeDirection direction, const QPoint& origin, const WindowBounds& baseline);

    /// Any state -> Idle
    void end();

private:
    std::variant<IdleState, DragState, ResizeState> m_state;
};

ELIXI_EXPORT const char* toString(InteractionSession::Kind kind);

} // namespace Elixi
