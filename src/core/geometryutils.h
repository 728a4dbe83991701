// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "elixi_export.h"
#include <QPoint>
#include <QRect>
#include <QSize>

namespace Elixi {

/**
 * @brief Geometry helpers shared by the shell components
 */
namespace GeometryUtils {

/**
 * @brief Initial window position inset from the bottom-right corner of an area
 * @param usableArea Usable screen area (panels/taskbars excluded)
 * @param inset Distance of the window's top-left from the area's bottom-right
 * @return (area.x + area.width - inset.width, area.y + area.height - inset.height)
 *
 * The result is not clamped into the area: an inset larger than the area
 * puts the window above/left of it, which the geometry owner may correct.
 */
ELIXI_EXPORT QPoint insetFromBottomRight(const QRect& usableArea, const QSize& inset);

} // namespace GeometryUtils

} // namespace Elixi
