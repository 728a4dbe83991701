// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dragcontroller.h"

namespace Elixi {

namespace DragController {

QPoint targetPosition(const DragState& drag, const QPoint& pointer)
{
    const QPoint delta = pointer - drag.origin;
    return drag.baseline.topLeft() + delta;
}

} // namespace DragController

} // namespace Elixi
