// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include "../core/constants.h"
#include <KConfigGroup>
#include <KSharedConfig>

namespace TabDrop {

/**
 * @brief Drag engine settings backed by tabdroprc
 *
 * Implements the IDragSettings interface with KConfig integration. Defaults
 * come from tabdrop.kcfg through ConfigDefaults; values outside their valid
 * range are replaced with the default on load.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class TABDROP_EXPORT Settings : public IDragSettings
{
    Q_OBJECT

    // Drag
    Q_PROPERTY(int dragThreshold READ dragThreshold WRITE setDragThreshold NOTIFY dragThresholdChanged)
    Q_PROPERTY(int windowEdgeHysteresis READ windowEdgeHysteresis WRITE setWindowEdgeHysteresis NOTIFY
                   windowEdgeHysteresisChanged)

    // Geometry
    Q_PROPERTY(qreal cellSize READ cellSize WRITE setCellSize NOTIFY cellSizeChanged)
    Q_PROPERTY(qreal cellSpacing READ cellSpacing WRITE setCellSpacing NOTIFY cellSpacingChanged)
    Q_PROPERTY(qreal indicatorThickness READ indicatorThickness WRITE setIndicatorThickness NOTIFY
                   indicatorThicknessChanged)
    Q_PROPERTY(qreal indicatorInset READ indicatorInset WRITE setIndicatorInset NOTIFY indicatorInsetChanged)
    Q_PROPERTY(qreal emptyZoneIndicatorFraction READ emptyZoneIndicatorFraction WRITE setEmptyZoneIndicatorFraction
                   NOTIFY emptyZoneIndicatorFractionChanged)

    // Preview
    Q_PROPERTY(int previewWidth READ previewWidth WRITE setPreviewWidth NOTIFY previewWidthChanged)
    Q_PROPERTY(int previewHeight READ previewHeight WRITE setPreviewHeight NOTIFY previewHeightChanged)
    Q_PROPERTY(bool centerPreviewInSidebar READ centerPreviewInSidebar WRITE setCenterPreviewInSidebar NOTIFY
                   centerPreviewInSidebarChanged)
    Q_PROPERTY(bool previewWindowEnabled READ previewWindowEnabled WRITE setPreviewWindowEnabled NOTIFY
                   previewWindowEnabledChanged)

    // Feedback
    Q_PROPERTY(bool feedbackEnabled READ feedbackEnabled WRITE setFeedbackEnabled NOTIFY feedbackEnabledChanged)

public:
    explicit Settings(QObject* parent = nullptr);
    /// Use @p config instead of tabdroprc. Intended for tests.
    explicit Settings(KSharedConfig::Ptr config, QObject* parent = nullptr);
    ~Settings() override = default;

    // Drag
    int dragThreshold() const override { return m_dragThreshold; }
    void setDragThreshold(int threshold);
    int windowEdgeHysteresis() const override { return m_windowEdgeHysteresis; }
    void setWindowEdgeHysteresis(int margin);

    // Geometry
    qreal cellSize() const override { return m_cellSize; }
    void setCellSize(qreal size);
    qreal cellSpacing() const override { return m_cellSpacing; }
    void setCellSpacing(qreal spacing);
    qreal indicatorThickness() const override { return m_indicatorThickness; }
    void setIndicatorThickness(qreal thickness);
    qreal indicatorInset() const override { return m_indicatorInset; }
    void setIndicatorInset(qreal inset);
    qreal emptyZoneIndicatorFraction() const override { return m_emptyZoneIndicatorFraction; }
    void setEmptyZoneIndicatorFraction(qreal fraction);

    // Preview
    int previewWidth() const override { return m_previewWidth; }
    void setPreviewWidth(int width);
    int previewHeight() const override { return m_previewHeight; }
    void setPreviewHeight(int height);
    bool centerPreviewInSidebar() const override { return m_centerPreviewInSidebar; }
    void setCenterPreviewInSidebar(bool center);
    bool previewWindowEnabled() const override { return m_previewWindowEnabled; }
    void setPreviewWindowEnabled(bool enabled);

    // Feedback
    bool feedbackEnabled() const override { return m_feedbackEnabled; }
    void setFeedbackEnabled(bool enabled);

    // Persistence
    void load();
    void save();
    void reset();

Q_SIGNALS:
    void dragThresholdChanged();
    void windowEdgeHysteresisChanged();
    void cellSizeChanged();
    void cellSpacingChanged();
    void indicatorThicknessChanged();
    void indicatorInsetChanged();
    void emptyZoneIndicatorFractionChanged();
    void previewWidthChanged();
    void previewHeightChanged();
    void centerPreviewInSidebarChanged();
    void previewWindowEnabledChanged();
    void feedbackEnabledChanged();

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);
    static qreal readValidatedReal(const KConfigGroup& group, const char* key, qreal defaultValue, qreal min,
                                   qreal max, const char* settingName);

    KSharedConfig::Ptr m_config;

    // Drag
    int m_dragThreshold = Defaults::DragThreshold;
    int m_windowEdgeHysteresis = Defaults::WindowEdgeHysteresis;

    // Geometry
    qreal m_cellSize = Defaults::CellSize;
    qreal m_cellSpacing = Defaults::CellSpacing;
    qreal m_indicatorThickness = Defaults::IndicatorThickness;
    qreal m_indicatorInset = Defaults::IndicatorInset;
    qreal m_emptyZoneIndicatorFraction = Defaults::EmptyZoneIndicatorFraction;

    // Preview
    int m_previewWidth = Defaults::PreviewWidth;
    int m_previewHeight = Defaults::PreviewHeight;
    bool m_centerPreviewInSidebar = true;
    bool m_previewWindowEnabled = true;

    // Feedback
    bool m_feedbackEnabled = true;
};

} // namespace TabDrop
