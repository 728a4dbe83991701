// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geometryutils.h"

namespace Elixi {

namespace GeometryUtils {

QPoint insetFromBottomRight(const QRect& usableArea, const QSize& inset)
{
    // QRect::right() is x + width - 1, so derive the edge from width instead
    return QPoint(usableArea.x() + usableArea.width() - inset.width(),
                  usableArea.y() + usableArea.height() - inset.height());
}

} // namespace GeometryUtils

} // namespace Elixi
