// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interfaces.h"

namespace Elixi {

// Key function anchors the vtable to this translation unit across the library boundary
IGeometryOwner::~IGeometryOwner() = default;

} // namespace Elixi
