// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QRectF>
#include <QVector>

#include "core/constants.h"
#include "core/interfaces.h"

namespace TabDrop {
namespace TestHelpers {

/**
 * @brief Window list set directly by the test
 */
class FakeWindowProvider : public IWindowProvider
{
public:
    QVector<WindowInfo> visibleWindows() const override { return windows; }

    QVector<WindowInfo> windows;
};

/**
 * @brief Tab owner that records every operation it receives
 */
class RecordingTabOwner : public ITabOwner
{
public:
    void applyDragOperation(const DragOperation& operation) override { operations.append(operation); }

    QVector<DragOperation> operations;
};

/**
 * @brief In-memory IDragSettings with public fields
 *
 * Call notify() after changing fields to emit settingsChanged().
 */
class FakeDragSettings : public IDragSettings
{
public:
    int dragThreshold() const override { return threshold; }
    int windowEdgeHysteresis() const override { return hysteresis; }
    qreal cellSize() const override { return cell; }
    qreal cellSpacing() const override { return spacing; }
    qreal indicatorThickness() const override { return thickness; }
    qreal indicatorInset() const override { return inset; }
    qreal emptyZoneIndicatorFraction() const override { return emptyFraction; }
    int previewWidth() const override { return width; }
    int previewHeight() const override { return height; }
    bool centerPreviewInSidebar() const override { return centerInSidebar; }
    bool previewWindowEnabled() const override { return previewWindow; }
    bool feedbackEnabled() const override { return feedback; }

    void notify() { Q_EMIT settingsChanged(); }

    int threshold = Defaults::DragThreshold;
    int hysteresis = Defaults::WindowEdgeHysteresis;
    qreal cell = Defaults::CellSize;
    qreal spacing = Defaults::CellSpacing;
    qreal thickness = Defaults::IndicatorThickness;
    qreal inset = Defaults::IndicatorInset;
    qreal emptyFraction = Defaults::EmptyZoneIndicatorFraction;
    int width = Defaults::PreviewWidth;
    int height = Defaults::PreviewHeight;
    bool centerInSidebar = true;
    bool previewWindow = false;
    bool feedback = true;
};

/// Vertical list rows: y = i * (height + spacing)
inline QVector<QRectF> listFrames(int count, qreal height = 36.0, qreal spacing = 2.0, qreal width = 200.0)
{
    QVector<QRectF> frames;
    for (int i = 0; i < count; ++i) {
        frames.append(QRectF(0.0, i * (height + spacing), width, height));
    }
    return frames;
}

/// Row-major square cells with @p gap between them
inline QVector<QRectF> gridFrames(int count, int columns, qreal cell = 50.0, qreal gap = 10.0)
{
    QVector<QRectF> frames;
    for (int i = 0; i < count; ++i) {
        frames.append(QRectF((i % columns) * (cell + gap), (i / columns) * (cell + gap), cell, cell));
    }
    return frames;
}

} // namespace TestHelpers
} // namespace TabDrop
