// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "elixi_export.h"
#include "interactionsession.h"
#include "windowbounds.h"
#include <QObject>
#include <QPoint>
#include <optional>

namespace Elixi {

class IGeometryOwner;

/**
 * @brief Drives the pointer session against the geometry owner
 *
 * Lifecycle:
 *   beginDrag / beginResize -> (bounds handshake) -> pointerMoved* -> pointerReleased
 *
 * A begin call only asks the owner for the current bounds. The session
 * leaves Idle when that reply arrives; pointer moves that come earlier are
 * dropped, not queued. A failed or timed-out reply leaves the session Idle
 * and nothing is sent. A release before the reply cancels the handshake and
 * the late reply is ignored.
 *
 * While dragging, every move sends one set-position; while resizing, every
 * move sends one set-size clamped to the constraints. Nothing is sent while Idle.
 */
class ELIXI_EXPORT WindowInteractionController : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool dragging READ isDragging NOTIFY sessionChanged)
    Q_PROPERTY(bool resizing READ isResizing NOTIFY sessionChanged)

public:
    WindowInteractionController(IGeometryOwner* owner, const SizeConstraints& constraints,
                                QObject* parent = nullptr);
    ~WindowInteractionController() override;

    /**
     * @brief Request a drag session
     * @param origin Global pointer position at press
     * @return true while the handshake is pending or the session is active,
     *         false if the request was rejected or failed immediately
     */
    bool beginDrag(const QPoint& origin);

    /**
     * @brief Request a resize session from the handle @p direction
     * @return see beginDrag()
     */
    bool beginResize(ResizeDirection direction, const QPoint& origin);

    void pointerMoved(const QPoint& position);
    void pointerReleased();

    const InteractionSession& session() const { return m_session; }
    bool isIdle() const { return m_session.isIdle(); }
    bool isDragging() const { return m_session.isDragging(); }
    bool isResizing() const { return m_session.isResizing(); }
    bool isHandshakePending() const { return m_pending.has_value(); }

    const SizeConstraints& constraints() const { return m_constraints; }

Q_SIGNALS:
    void sessionStarted(Elixi::InteractionSession::Kind kind);
    void sessionEnded();
    void sessionChanged();
    /// The bounds query for a pending session failed; the session stays Idle
    void handshakeFailed();

private:
    struct PendingStart {
        quint64 generation = 0;
        QPoint origin;
        std::optional<ResizeDirection> direction; ///< nullopt = drag
    };

    bool requestSession(const QPoint& origin, std::optional<ResizeDirection> direction);
    void onBaselineReceived(quint64 generation, const std::optional<WindowBounds>& bounds);

    IGeometryOwner* m_owner;
    const SizeConstraints m_constraints;
    InteractionSession m_session;

    std::optional<PendingStart> m_pending;
    // Bumped per request so a late reply for a cancelled handshake is recognised
    quint64 m_generation = 0;
};

} // namespace Elixi
