// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "resizecontroller.h"

namespace Elixi {

namespace ResizeController {

QSize targetSize(const ResizeState& resize, const QPoint& pointer, const SizeConstraints& constraints)
{
    const QPoint delta = pointer - resize.origin;

    int width = resize.baseline.width();
    int height = resize.baseline.height();

    // TODO: adjust x/y for left/top handles once the window host documents
    // which edge it keeps fixed when applying setSize
    if (ResizeDirections::hasHorizontalComponent(resize.direction)) {
        width += delta.x();
    }
    if (ResizeDirections::hasVerticalComponent(resize.direction)) {
        height += delta.y();
    }

    // Clamp both axes, including untouched ones, so nothing out of range is ever dispatched
    return constraints.clamp(QSize(width, height));
}

} // namespace ResizeController

} // namespace Elixi
