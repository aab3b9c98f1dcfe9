// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "boundarycalculator.h"
#include "logging.h"

#include <QSizeF>

#include <algorithm>
#include <cmath>
#include <limits>

namespace TabDrop {
namespace BoundaryCalculator {

namespace {

constexpr qreal HalfStrip = Defaults::GridBoundaryThickness / 2.0;

qreal leadingEdge(const QRectF& rect, Qt::Orientation axis)
{
    return axis == Qt::Vertical ? rect.top() : rect.left();
}

qreal trailingEdge(const QRectF& rect, Qt::Orientation axis)
{
    return axis == Qt::Vertical ? rect.bottom() : rect.right();
}

// Vertical strip centred on x, spanning one row
QRectF verticalStrip(qreal x, qreal rowTop, qreal rowBottom)
{
    return QRectF(x - HalfStrip, rowTop, Defaults::GridBoundaryThickness, rowBottom - rowTop);
}

// Horizontal strip centred on y, spanning the container
QRectF horizontalStrip(qreal y, qreal containerWidth)
{
    return QRectF(0.0, y - HalfStrip, containerWidth, Defaults::GridBoundaryThickness);
}

bool isFinitePoint(const QPointF& point)
{
    return std::isfinite(point.x()) && std::isfinite(point.y());
}

} // anonymous namespace

QVector<qreal> computeListBoundaries(const QVector<QRectF>& frames, Qt::Orientation axis)
{
    QVector<qreal> boundaries;
    if (frames.isEmpty()) {
        return boundaries;
    }

    const int count = frames.size();
    boundaries.reserve(count + 1);
    boundaries.append(leadingEdge(frames.first(), axis));
    for (int i = 0; i < count - 1; ++i) {
        boundaries.append((trailingEdge(frames[i], axis) + leadingEdge(frames[i + 1], axis)) / 2.0);
    }
    boundaries.append(trailingEdge(frames.last(), axis));
    return boundaries;
}

QVector<GridBoundary> computeGridBoundaries(const QVector<QRectF>& frames, int columns, qreal containerWidth, qreal gap)
{
    QVector<GridBoundary> boundaries;
    const int count = frames.size();
    if (count == 0) {
        return boundaries;
    }
    if (columns < 1) {
        qCWarning(lcGeometry) << "Grid boundaries requested with invalid column count" << columns;
        return boundaries;
    }

    // Per-row vertical span
    const int totalRows = (count + columns - 1) / columns;
    QVector<qreal> rowMinY(totalRows);
    QVector<qreal> rowMaxY(totalRows);
    for (int row = 0; row < totalRows; ++row) {
        const int start = row * columns;
        const int end = std::min(start + columns, count);
        qreal minY = frames[start].top();
        qreal maxY = frames[start].bottom();
        for (int i = start + 1; i < end; ++i) {
            minY = std::min(minY, frames[i].top());
            maxY = std::max(maxY, frames[i].bottom());
        }
        rowMinY[row] = minY;
        rowMaxY[row] = maxY;
    }

    boundaries.reserve(count + 1);
    for (int i = 0; i <= count; ++i) {
        GridBoundary boundary;
        boundary.index = i;

        if (i == 0) {
            boundary.orientation = BoundaryOrientation::Vertical;
            boundary.frame = verticalStrip(frames.first().left() - gap / 2.0, rowMinY[0], rowMaxY[0]);
        } else if (i == count) {
            const int last = count - 1;
            const int lastRow = last / columns;
            const int cellsInLastRow = last - lastRow * columns + 1;
            if (cellsInLastRow < columns) {
                boundary.orientation = BoundaryOrientation::Vertical;
                boundary.frame =
                    verticalStrip(frames[last].right() + gap / 2.0, rowMinY[lastRow], rowMaxY[lastRow]);
            } else {
                boundary.orientation = BoundaryOrientation::Horizontal;
                boundary.frame = horizontalStrip(rowMaxY[lastRow] + gap / 2.0, containerWidth);
            }
        } else if (i % columns == 0) {
            const int row = i / columns;
            boundary.orientation = BoundaryOrientation::Horizontal;
            boundary.frame = horizontalStrip((rowMaxY[row - 1] + rowMinY[row]) / 2.0, containerWidth);
        } else {
            const int row = i / columns;
            const qreal x = (frames[i - 1].right() + frames[i].left()) / 2.0;
            boundary.orientation = BoundaryOrientation::Vertical;
            boundary.frame = verticalStrip(x, rowMinY[row], rowMaxY[row]);
        }

        boundaries.append(boundary);
    }

    return boundaries;
}

int resolveInsertionIndex(qreal position, const QVector<qreal>& boundaries)
{
    if (boundaries.isEmpty()) {
        return 0;
    }
    if (!std::isfinite(position)) {
        qCWarning(lcGeometry) << "Ignoring non-finite list position" << position;
        return 0;
    }

    for (int i = 0; i < boundaries.size(); ++i) {
        if (position <= boundaries[i]) {
            return i;
        }
    }
    return boundaries.size() - 1;
}

int resolveInsertionIndex(const QPointF& point, const QVector<GridBoundary>& boundaries)
{
    if (boundaries.isEmpty()) {
        return 0;
    }
    if (!isFinitePoint(point)) {
        qCWarning(lcGeometry) << "Ignoring non-finite grid point" << point;
        return 0;
    }

    int bestIndex = boundaries.first().index;
    qreal bestDistance = std::numeric_limits<qreal>::max();
    for (const GridBoundary& boundary : boundaries) {
        const qreal distance = pointToSegmentDistance(point, boundary.segment());
        if (distance < bestDistance) {
            bestDistance = distance;
            bestIndex = boundary.index;
        }
    }
    return std::max(0, bestIndex);
}

qreal pointToSegmentDistance(const QPointF& point, const QLineF& segment)
{
    const QPointF delta = segment.p2() - segment.p1();
    const qreal lengthSquared = QPointF::dotProduct(delta, delta);
    if (qFuzzyIsNull(lengthSquared)) {
        return QLineF(point, segment.p1()).length();
    }

    const qreal t = std::clamp(QPointF::dotProduct(point - segment.p1(), delta) / lengthSquared, 0.0, 1.0);
    const QPointF projection = segment.p1() + t * delta;
    return QLineF(point, projection).length();
}

qreal estimatedGridWidth(const QVector<QRectF>& frames)
{
    if (frames.isEmpty()) {
        return 0.0;
    }

    qreal minX = frames.first().left();
    qreal maxX = frames.first().right();
    for (const QRectF& frame : frames) {
        minX = std::min(minX, frame.left());
        maxX = std::max(maxX, frame.right());
    }
    return std::max(0.0, maxX - minX);
}

QVector<QRectF> synthesizeFrames(const DropZoneGeometry& geometry)
{
    QVector<QRectF> frames;
    if (geometry.itemCount <= 0 || geometry.cellSize <= 0.0) {
        return frames;
    }

    const qreal step = geometry.cellSize + geometry.spacing;
    frames.reserve(geometry.itemCount);

    if (geometry.isGrid()) {
        const int columns = *geometry.columns;
        // Cells share the zone width; cell size is the row height
        const qreal width = geometry.frame.width() > 0.0
            ? (geometry.frame.width() - geometry.spacing * (columns - 1)) / columns
            : geometry.cellSize;
        for (int i = 0; i < geometry.itemCount; ++i) {
            const int row = i / columns;
            const int column = i % columns;
            frames.append(QRectF(column * (width + geometry.spacing), row * step, width, geometry.cellSize));
        }
        return frames;
    }

    const qreal crossExtent = geometry.axis == Qt::Vertical ? geometry.frame.width() : geometry.frame.height();
    for (int i = 0; i < geometry.itemCount; ++i) {
        if (geometry.axis == Qt::Vertical) {
            frames.append(QRectF(0.0, i * step, crossExtent, geometry.cellSize));
        } else {
            frames.append(QRectF(i * step, 0.0, geometry.cellSize, crossExtent));
        }
    }
    return frames;
}

QRectF listIndicatorFrame(qreal boundaryOffset, const QSizeF& zoneSize, Qt::Orientation axis, qreal inset,
                          qreal thickness)
{
    const qreal extent = axis == Qt::Vertical ? zoneSize.height() : zoneSize.width();
    const qreal crossExtent = axis == Qt::Vertical ? zoneSize.width() : zoneSize.height();

    // Keep the whole strip inside the zone
    qreal offset = boundaryOffset;
    if (extent > 2.0 * Defaults::MinimumIndicatorOffset) {
        offset = std::clamp(offset, Defaults::MinimumIndicatorOffset, extent - Defaults::MinimumIndicatorOffset);
    }

    const qreal length = std::max(crossExtent - 2.0 * inset, 1.0);
    if (axis == Qt::Vertical) {
        return QRectF(inset, offset - thickness / 2.0, length, thickness);
    }
    return QRectF(offset - thickness / 2.0, inset, thickness, length);
}

QRectF emptyZoneIndicatorFrame(const QSizeF& zoneSize, Qt::Orientation axis, qreal fraction, qreal inset,
                               qreal thickness)
{
    const qreal extent = axis == Qt::Vertical ? zoneSize.height() : zoneSize.width();
    const qreal offset = std::max(extent * fraction, Defaults::MinimumIndicatorOffset);
    return listIndicatorFrame(offset, zoneSize, axis, inset, thickness);
}

} // namespace BoundaryCalculator
} // namespace TabDrop
