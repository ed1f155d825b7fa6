// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace Tessera {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "tessera.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcOutput, "tessera.output", QtInfoMsg)

// Tiling module categories
Q_LOGGING_CATEGORY(lcTiling, "tessera.tiling", QtInfoMsg)
Q_LOGGING_CATEGORY(lcFocus, "tessera.tiling.focus", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "tessera.config", QtInfoMsg)

} // namespace Tessera
