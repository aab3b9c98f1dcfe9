// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace TabDrop {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "tabdrop.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcGeometry, "tabdrop.geometry", QtInfoMsg)
Q_LOGGING_CATEGORY(lcLock, "tabdrop.lock", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSession, "tabdrop.session", QtInfoMsg)
Q_LOGGING_CATEGORY(lcZones, "tabdrop.zones", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCommit, "tabdrop.commit", QtInfoMsg)

// Adapter module categories
Q_LOGGING_CATEGORY(lcSource, "tabdrop.source", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTarget, "tabdrop.target", QtInfoMsg)
Q_LOGGING_CATEGORY(lcWindows, "tabdrop.windows", QtInfoMsg)

// Model category
Q_LOGGING_CATEGORY(lcModel, "tabdrop.model", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "tabdrop.config", QtInfoMsg)

} // namespace TabDrop
