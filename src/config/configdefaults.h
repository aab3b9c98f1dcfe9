// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabdropconfig.h" // Generated from tabdrop.kcfg via KConfigXT

#include <QtGlobal>

namespace TabDrop {

/**
 * @brief Provides static access to default configuration values
 *
 * This class wraps the KConfigXT-generated TabDropConfig class to provide
 * static access to default values. The .kcfg file is the SINGLE SOURCE OF TRUTH
 * for all defaults - this class simply exposes those generated defaults.
 *
 * Usage:
 *   int threshold = ConfigDefaults::dragThreshold();  // Returns 4 (from .kcfg)
 *
 * The valid ranges mirror the <min>/<max> of each entry and are used by
 * Settings to reject out-of-range values read from tabdroprc.
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Drag
    // ═══════════════════════════════════════════════════════════════════════════

    static int dragThreshold() { return instance().defaultDragThresholdValue(); }
    static constexpr int dragThresholdMin() { return 1; }
    static constexpr int dragThresholdMax() { return 50; }

    static int windowEdgeHysteresis() { return instance().defaultWindowEdgeHysteresisValue(); }
    static constexpr int windowEdgeHysteresisMin() { return 0; }
    static constexpr int windowEdgeHysteresisMax() { return 20; }

    // ═══════════════════════════════════════════════════════════════════════════
    // Geometry
    // ═══════════════════════════════════════════════════════════════════════════

    static qreal cellSize() { return instance().defaultCellSizeValue(); }
    static constexpr qreal cellSizeMin() { return 1.0; }
    static constexpr qreal cellSizeMax() { return 512.0; }

    static qreal cellSpacing() { return instance().defaultCellSpacingValue(); }
    static constexpr qreal cellSpacingMin() { return 0.0; }
    static constexpr qreal cellSpacingMax() { return 128.0; }

    static qreal indicatorThickness() { return instance().defaultIndicatorThicknessValue(); }
    static constexpr qreal indicatorThicknessMin() { return 1.0; }
    static constexpr qreal indicatorThicknessMax() { return 20.0; }

    static qreal indicatorInset() { return instance().defaultIndicatorInsetValue(); }
    static constexpr qreal indicatorInsetMin() { return 0.0; }
    static constexpr qreal indicatorInsetMax() { return 100.0; }

    static qreal emptyZoneIndicatorFraction() { return instance().defaultEmptyZoneIndicatorFractionValue(); }
    static constexpr qreal emptyZoneIndicatorFractionMin() { return 0.0; }
    static constexpr qreal emptyZoneIndicatorFractionMax() { return 1.0; }

    // ═══════════════════════════════════════════════════════════════════════════
    // Preview
    // ═══════════════════════════════════════════════════════════════════════════

    static int previewWidth() { return instance().defaultPreviewWidthValue(); }
    static int previewHeight() { return instance().defaultPreviewHeightValue(); }
    static constexpr int previewSizeMin() { return 16; }
    static constexpr int previewSizeMax() { return 1024; }

    static bool centerPreviewInSidebar() { return instance().defaultCenterPreviewInSidebarValue(); }
    static bool previewWindowEnabled() { return instance().defaultPreviewWindowEnabledValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Feedback
    // ═══════════════════════════════════════════════════════════════════════════

    static bool feedbackEnabled() { return instance().defaultFeedbackEnabledValue(); }

private:
    // Lazily-initialized singleton instance
    static TabDropConfig& instance()
    {
        static TabDropConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace TabDrop
