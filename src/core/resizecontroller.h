// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "elixi_export.h"
#include "interactionsession.h"
#include "windowbounds.h"
#include <QPoint>
#include <QSize>

namespace Elixi {

namespace ResizeController {

/**
 * @brief Window size for a pointer position during a resize
 * @param resize Active resize session (direction, origin, baseline snapshot)
 * @param pointer Current global pointer position
 * @param constraints Min/max window size
 * @return Size already clamped to @p constraints on both axes
 *
 * With delta = pointer - origin:
 * - a horizontal component (left or right) yields baseline.width + delta.x
 * - a vertical component (top or bottom) yields baseline.height + delta.y
 * - an axis the direction does not touch keeps the baseline value
 *
 * Left and top handles use the same sign as right and bottom, and the
 * window origin is not moved. Corners apply both axis rules independently.
 */
ELIXI_EXPORT QSize targetSize(const ResizeState& resize, const QPoint& pointer, const SizeConstraints& constraints);

} // namespace ResizeController

} // namespace Elixi
