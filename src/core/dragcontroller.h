// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "elixi_export.h"
#include "interactionsession.h"
#include <QPoint>

namespace Elixi {

namespace DragController {

/**
 * @brief Window position for a pointer position during a drag
 * @param drag Active drag session (origin + baseline snapshot)
 * @param pointer Current global pointer position
 * @return baseline.topLeft() + (pointer - origin)
 *
 * No clamping: the window may be dragged partly or fully off-screen.
 * Keeping it on-screen is left to the geometry owner.
 */
ELIXI_EXPORT QPoint targetPosition(const DragState& drag, const QPoint& pointer);

} // namespace DragController

} // namespace Elixi
