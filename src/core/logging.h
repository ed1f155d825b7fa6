// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tessera_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for Tessera
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "core/logging.h"
 *   qCDebug(lcTiling) << "Debug message";
 *   qCWarning(lcOutput) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="tessera.*=true"                 # Enable all
 *   QT_LOGGING_RULES="tessera.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="tessera.tiling.focus=true"      # Enable focus search only
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing, disabled in release builds
 *   qCInfo     - Significant operational events (output mapped, trees merged)
 *   qCWarning  - Recoverable errors, unknown outputs, invalid input
 *   qFatal     - Broken tree invariants, the process cannot continue
 */

namespace Tessera {

// Core module - window/output abstractions, geometry helpers
TESSERA_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
TESSERA_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcOutput)

// Tiling module - partition trees, propagation, merge
TESSERA_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcTiling)
TESSERA_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcFocus)

// Configuration module - settings loading/saving
TESSERA_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace Tessera
