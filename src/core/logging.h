// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabdrop_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for TabDrop
 *
 * This file defines Qt logging categories that enable runtime filtering
 * of log messages. Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcSession) << "Debug message";
 *   qCInfo(lcSession) << "Info message";
 *   qCWarning(lcSession) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="tabdrop.*=true"                 # Enable all
 *   QT_LOGGING_RULES="tabdrop.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="tabdrop.geometry.debug=true"    # Trace boundary math only
 *
 * Severity Guidelines:
 *   qCDebug    - Per pointer-tick tracing (cursor moves, index resolution)
 *   qCInfo     - Drag lifecycle events (begin, commit, cancel, lock acquire/release)
 *   qCWarning  - Rejected input (non-finite coordinates, invalid config values)
 *   qCCritical - Not used; this subsystem has no fatal errors
 */

namespace TabDrop {

// Core module - value types, geometry, lock, registry, session, commit
TABDROP_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
TABDROP_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcGeometry)
TABDROP_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcLock)
TABDROP_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcSession)
TABDROP_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcZones)
TABDROP_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCommit)

// Adapter module - drag sources, pointer monitor, drop targets, windows
TABDROP_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcSource)
TABDROP_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcTarget)
TABDROP_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcWindows)

// Reference tab-ownership model
TABDROP_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcModel)

// Configuration module - settings loading/saving
TABDROP_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace TabDrop
