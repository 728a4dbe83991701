// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "PlacementBootstrapper.h"
#include "../core/geometryutils.h"
#include "../core/interfaces.h"
#include "../core/logging.h"

#include <QPointer>
#include <QWindow>

namespace Elixi {

PlacementBootstrapper::PlacementBootstrapper(IGeometryOwner* owner, const QSize& inset, QObject* parent)
    : QObject(parent)
    , m_owner(owner)
    , m_inset(inset)
{
    Q_ASSERT(m_owner);
}

void PlacementBootstrapper::attach(QWindow* window)
{
    if (!window) {
        qCWarning(lcShell) << "Cannot attach placement - no window";
        return;
    }

    if (window->isVisible()) {
        run();
        return;
    }

    connect(
        window, &QWindow::visibleChanged, this,
        [this](bool visible) {
            if (visible) {
                run();
            }
        });
}

void PlacementBootstrapper::run()
{
    if (m_started) {
        return;
    }
    m_started = true;

    QPointer<PlacementBootstrapper> self(this);
    m_owner->queryDisplayBounds([self](const std::optional<QRect>& area) {
        if (!self) {
            return;
        }
        if (!area || area->isEmpty()) {
            qCWarning(lcShell) << "Display bounds unavailable - keeping default window position";
            Q_EMIT self->skipped();
            return;
        }

        const QPoint position = GeometryUtils::insetFromBottomRight(*area, self->m_inset);
        qCInfo(lcShell) << "Initial placement at" << position << "in usable area" << *area;
        self->m_owner->setPosition(position);
        Q_EMIT self->placed(position);
    });
}

} // namespace Elixi
