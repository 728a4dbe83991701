// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "elixi_export.h"
#include "windowbounds.h"
#include <QObject>
#include <QPoint>
#include <QSize>
#include <QString>
#include <functional>
#include <optional>

namespace Elixi {

/**
 * @brief Channel to the out-of-process window host that owns the real geometry
 *
 * The shell never moves or resizes its own window. It asks the host for the
 * current bounds and sends position/size commands; the host applies them.
 *
 * Queries are asynchronous and answer exactly once through the callback,
 * with std::nullopt on error or timeout. The callback may run before the
 * query call returns (e.g. when the bus is not connected).
 *
 * Commands are one-way: no reply is awaited and no coalescing is done.
 * The host is expected to receive them in send order.
 */
class ELIXI_EXPORT IGeometryOwner : public QObject
{
    Q_OBJECT

public:
    using BoundsCallback = std::function<void(const std::optional<WindowBounds>&)>;

    explicit IGeometryOwner(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~IGeometryOwner() override;

    /// Current window geometry (get-bounds)
    virtual void queryBounds(BoundsCallback callback) = 0;

    /// Usable area of the display the window lives on (get-display-bounds)
    virtual void queryDisplayBounds(BoundsCallback callback) = 0;

    virtual void setPosition(const QPoint& position) = 0;
    /// @p size is expected to be clamped already; the host does not re-check it
    virtual void setSize(const QSize& size) = 0;

    virtual void minimize() = 0;
    /// Hide, not close
    virtual void hide() = 0;
    virtual void show() = 0;
    virtual void setAlwaysOnTop(bool enabled) = 0;
    virtual void showContextMenu(const QPoint& globalPosition) = 0;

Q_SIGNALS:
    /// Host asks the shell to focus its input field
    void focusRequested();

    /// Backend memory usage in MB, for display only
    void memoryUsageChanged(double megabytes);

    /// Notification text pushed by the host, for display only
    void notificationPosted(const QString& message);

    /**
     * @brief Emitted when a call to the host fails
     * @param error Translated message describing what went wrong
     */
    void errorOccurred(const QString& error);
};

} // namespace Elixi
