// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace Elixi {

Q_LOGGING_CATEGORY(lcCore, "elixi.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSession, "elixi.core.session", QtInfoMsg)

Q_LOGGING_CATEGORY(lcDbus, "elixi.dbus", QtInfoMsg)

Q_LOGGING_CATEGORY(lcShell, "elixi.shell", QtInfoMsg)

Q_LOGGING_CATEGORY(lcConfig, "elixi.config", QtInfoMsg)

} // namespace Elixi
