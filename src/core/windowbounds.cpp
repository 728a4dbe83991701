// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowbounds.h"
#include "logging.h"

#include <QtGlobal>
#include <array>

namespace Elixi {

namespace {

struct DirectionToken {
    ResizeDirection direction;
    QLatin1String token;
};

constexpr std::array<DirectionToken, 8> kDirectionTokens{{
    {ResizeDirection::Top, QLatin1String("top")},
    {ResizeDirection::Bottom, QLatin1String("bottom")},
    {ResizeDirection::Left, QLatin1String("left")},
    {ResizeDirection::Right, QLatin1String("right")},
    {ResizeDirection::TopLeft, QLatin1String("top-left")},
    {ResizeDirection::TopRight, QLatin1String("top-right")},
    {ResizeDirection::BottomLeft, QLatin1String("bottom-left")},
    {ResizeDirection::BottomRight, QLatin1String("bottom-right")},
}};

} // anonymous namespace

namespace ResizeDirections {

std::optional<ResizeDirection> fromToken(QStringView token)
{
    // Tokens come straight from QML properties; no trimming or case folding
    for (const auto& entry : kDirectionTokens) {
        if (token == entry.token) {
            return entry.direction;
        }
    }
    qCDebug(lcCore) << "Unknown resize direction token" << token;
    return std::nullopt;
}

QString toToken(ResizeDirection direction)
{
    for (const auto& entry : kDirectionTokens) {
        if (entry.direction == direction) {
            return QString(entry.token);
        }
    }
    return QString();
}

bool hasRightComponent(ResizeDirection direction)
{
    return direction == ResizeDirection::Right || direction == ResizeDirection::TopRight
        || direction == ResizeDirection::BottomRight;
}

bool hasLeftComponent(ResizeDirection direction)
{
    return direction == ResizeDirection::Left || direction == ResizeDirection::TopLeft
        || direction == ResizeDirection::BottomLeft;
}

bool hasBottomComponent(ResizeDirection direction)
{
    return direction == ResizeDirection::Bottom || direction == ResizeDirection::BottomLeft
        || direction == ResizeDirection::BottomRight;
}

bool hasTopComponent(ResizeDirection direction)
{
    return direction == ResizeDirection::Top || direction == ResizeDirection::TopLeft
        || direction == ResizeDirection::TopRight;
}

} // namespace ResizeDirections

bool SizeConstraints::isValid() const
{
    return minimum.width() > 0 && minimum.height() > 0 && minimum.width() <= maximum.width()
        && minimum.height() <= maximum.height();
}

int SizeConstraints::clampWidth(int width) const
{
    return qBound(minimum.width(), width, maximum.width());
}

int SizeConstraints::clampHeight(int height) const
{
    return qBound(minimum.height(), height, maximum.height());
}

QSize SizeConstraints::clamp(const QSize& size) const
{
    return QSize(clampWidth(size.width()), clampHeight(size.height()));
}

} // namespace Elixi
