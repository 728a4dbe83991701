// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ShellController.h"
#include "../core/interfaces.h"
#include "../core/logging.h"

#include <KLocalizedString>
#include <QPoint>
#include <cmath>

namespace Elixi {

ShellController::ShellController(IGeometryOwner* owner, bool alwaysOnTop, QObject* parent)
    : QObject(parent)
    , m_owner(owner)
    , m_alwaysOnTop(alwaysOnTop)
{
    Q_ASSERT(owner);

    connect(m_owner, &IGeometryOwner::focusRequested, this, &ShellController::onFocusRequested);
    connect(m_owner, &IGeometryOwner::memoryUsageChanged, this, &ShellController::onMemoryUsageChanged);
    connect(m_owner, &IGeometryOwner::notificationPosted, this, &ShellController::notificationReceived);
}

QString ShellController::title() const
{
    return m_backgroundMode ? i18nc("@title:window", "ELIXI (Background)") : i18nc("@title:window", "ELIXI Assistant");
}

void ShellController::setBackgroundMode(bool enabled)
{
    if (m_backgroundMode == enabled) {
        return;
    }
    m_backgroundMode = enabled;
    qCDebug(lcShell) << "Background mode:" << enabled;
    Q_EMIT backgroundModeChanged();
    Q_EMIT titleChanged();
}

QString ShellController::formatMemory(double megabytes)
{
    if (megabytes < 0 || std::isnan(megabytes)) {
        return QString();
    }
    return i18nc("@info:status memory usage of the assistant backend", "~%1 MB",
                 static_cast<qlonglong>(std::llround(megabytes)));
}

void ShellController::minimize()
{
    m_owner->minimize();
}

void ShellController::hideWindow()
{
    m_owner->hide();
}

void ShellController::toggleAlwaysOnTop()
{
    m_alwaysOnTop = !m_alwaysOnTop;
    m_owner->setAlwaysOnTop(m_alwaysOnTop);
    Q_EMIT alwaysOnTopChanged();
}

void ShellController::showContextMenu(const QPointF& globalPosition)
{
    m_owner->showContextMenu(globalPosition.toPoint());
}

void ShellController::onFocusRequested()
{
    m_owner->show();
    Q_EMIT focusInputRequested();
}

void ShellController::onMemoryUsageChanged(double megabytes)
{
    const QString text = formatMemory(megabytes);
    if (text == m_memoryText) {
        return;
    }
    m_memoryText = text;
    Q_EMIT memoryTextChanged();
}

} // namespace Elixi
