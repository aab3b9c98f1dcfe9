// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>
#include <QtGlobal>

namespace TabDrop {

/**
 * @brief Default values and structural constants for the core module
 *
 * These defaults are used by core module files that can't depend on config.
 * For user-configurable settings, see ConfigDefaults and tabdrop.kcfg.
 */
namespace Defaults {
// Pointer-gesture path
constexpr int DragThreshold = 4; // Displacement before a press becomes a drag
constexpr int WindowEdgeHysteresis = 2;

// Zone geometry fallbacks, used until the renderer pushes measurements
constexpr qreal CellSize = 36.0;
constexpr qreal CellSpacing = 2.0;

// Insertion indicator
constexpr qreal IndicatorThickness = 3.0;
constexpr qreal IndicatorInset = 10.0;
constexpr qreal GridBoundaryThickness = 3.0; // Hit strip centred on each grid boundary
constexpr qreal EmptyZoneIndicatorFraction = 1.0 / 3.0;
constexpr qreal MinimumIndicatorOffset = 1.5;

// Floating preview
constexpr int PreviewWidth = 320;
constexpr int PreviewHeight = 160;
constexpr int PreviewCornerRadius = 8;
constexpr qreal PreviewOpacity = 0.85;
constexpr qreal GhostPreviewOpacity = 0.5;
} // namespace Defaults

/**
 * @brief Drag pasteboard encoding
 *
 * The typed payload is a versioned JSON document. The plain-text fallback
 * carries only the tab identifier so other processes see something sensible.
 */
namespace MimeType {
inline constexpr QLatin1String TabItem{"application/x-tabdrop-tab-item"};
inline constexpr QLatin1String PlainText{"text/plain"};
} // namespace MimeType

namespace JsonKeys {
inline constexpr QLatin1String Version{"version"};
inline constexpr QLatin1String TabId{"tabId"};
inline constexpr QLatin1String Title{"title"};
inline constexpr QLatin1String Url{"url"};
} // namespace JsonKeys

constexpr int PayloadVersion = 1;

} // namespace TabDrop
