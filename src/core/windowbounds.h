// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "constants.h"
#include "elixi_export.h"
#include <QRect>
#include <QSize>
#include <QString>
#include <QStringView>
#include <optional>

namespace Elixi {

/**
 * @brief Absolute screen-space geometry of the overlay window
 *
 * Owned by the geometry owner. The shell only ever keeps snapshot copies.
 */
using WindowBounds = QRect;

/**
 * @brief Which handle initiated a resize
 *
 * Tokens (as carried by the QML handles): "top", "bottom", "left", "right",
 * "top-left", "top-right", "bottom-left", "bottom-right".
 */
enum class ResizeDirection {
    Top,
    Bottom,
    Left,
    Right,
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight
};

namespace ResizeDirections {

/**
 * @brief Parse a handle token
 * @return The direction, or std::nullopt for unknown/malformed tokens
 */
ELIXI_EXPORT std::optional<ResizeDirection> fromToken(QStringView token);

ELIXI_EXPORT QString toToken(ResizeDirection direction);

/// true for right, top-right and bottom-right
ELIXI_EXPORT bool hasRightComponent(ResizeDirection direction);
/// true for left, top-left and bottom-left
ELIXI_EXPORT bool hasLeftComponent(ResizeDirection direction);
/// true for bottom, bottom-left and bottom-right
ELIXI_EXPORT bool hasBottomComponent(ResizeDirection direction);
/// true for top, top-left and top-right
ELIXI_EXPORT bool hasTopComponent(ResizeDirection direction);

inline bool hasHorizontalComponent(ResizeDirection direction)
{
    return hasLeftComponent(direction) || hasRightComponent(direction);
}

inline bool hasVerticalComponent(ResizeDirection direction)
{
    return hasTopComponent(direction) || hasBottomComponent(direction);
}

} // namespace ResizeDirections

/**
 * @brief Min/max window size, fixed for the lifetime of the process
 */
struct ELIXI_EXPORT SizeConstraints {
    QSize minimum{Defaults::MinWidth, Defaults::MinHeight};
    QSize maximum{Defaults::MaxWidth, Defaults::MaxHeight};

    /// Both axes satisfy 0 < min <= max
    bool isValid() const;

    int clampWidth(int width) const;
    int clampHeight(int height) const;
    QSize clamp(const QSize& size) const;

    bool operator==(const SizeConstraints& other) const = default;
};

} // namespace Elixi
