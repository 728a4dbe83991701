// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "elixi_export.h"
#include <QObject>
#include <QPoint>
#include <QSize>

class QWindow;

namespace Elixi {

class IGeometryOwner;

/**
 * @brief Places the shell window near the bottom-right corner once per lifetime
 *
 * Asks the geometry owner for the usable display area and sends one
 * set-position inset from its bottom-right corner, so the window does not
 * open at (0,0). A failed query is not an error: the owner's default
 * position stays.
 */
class ELIXI_EXPORT PlacementBootstrapper : public QObject
{
    Q_OBJECT

public:
    PlacementBootstrapper(IGeometryOwner* owner, const QSize& inset, QObject* parent = nullptr);

    /**
     * @brief Run on the first time @p window becomes visible
     *
     * Runs immediately if the window is already visible.
     */
    void attach(QWindow* window);

    /// Query and place; does nothing after the first call
    void run();

    bool hasRun() const { return m_started; }

Q_SIGNALS:
    void placed(const QPoint& position);
    void skipped();

private:
    IGeometryOwner* m_owner;
    const QSize m_inset;
    bool m_started = false;
};

} // namespace Elixi
