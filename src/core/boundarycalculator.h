// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "constants.h"
#include "tabdrop_export.h"
#include "types.h"
#include <QLineF>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QVector>

namespace TabDrop {

/**
 * @brief Insertion boundary math for list and grid drop zones
 *
 * Pure functions over measured item frames in zone-local coordinates.
 * Everything is recomputed from the frames on each call; nothing is cached.
 */
namespace BoundaryCalculator {

/**
 * @brief Boundaries of a linear list along its axis
 * @param frames Item frames in list order, contiguous
 * @param axis Qt::Vertical for top-to-bottom lists, Qt::Horizontal for left-to-right rows
 * @return N+1 offsets: leading edge of the first item, midpoints between
 *         adjacent items, trailing edge of the last item. Empty for an empty zone.
 */
TABDROP_EXPORT QVector<qreal> computeListBoundaries(const QVector<QRectF>& frames, Qt::Orientation axis = Qt::Vertical);

/**
 * @brief Boundaries of a row-major grid
 * @param frames Cell frames in row-major order
 * @param columns Cells per row
 * @param containerWidth Width spanned by horizontal (between-row) boundaries
 * @param gap Spacing between cells
 * @return N+1 boundaries, or empty if @p frames is empty or @p columns < 1
 *
 * Boundary 0 is vertical, half a gap left of the first cell. The final
 * boundary is vertical after the last cell when the last row is incomplete
 * (the row has room for another item) and horizontal below the last row
 * otherwise. Boundaries at a row start are horizontal between the two rows,
 * all others are vertical between neighbouring cells. Row extents are taken
 * per row, so a row of mixed-height cells spans its tallest cell.
 */
TABDROP_EXPORT QVector<GridBoundary> computeGridBoundaries(const QVector<QRectF>& frames, int columns,
                                                           qreal containerWidth, qreal gap);

/**
 * @brief Index of the first boundary at or after @p position
 *
 * Clamped to [0, boundaries.size() - 1]. Returns 0 for an empty boundary list
 * or a non-finite position.
 */
TABDROP_EXPORT int resolveInsertionIndex(qreal position, const QVector<qreal>& boundaries);

/**
 * @brief Index of the boundary nearest to @p point
 *
 * Distance is measured to each boundary's centre segment, not its midpoint.
 * On equal distance the earlier boundary wins. Returns 0 for an empty
 * boundary list or a non-finite point.
 */
TABDROP_EXPORT int resolveInsertionIndex(const QPointF& point, const QVector<GridBoundary>& boundaries);

/// Convenience: the coordinate of @p point along @p axis
inline qreal axisPosition(const QPointF& point, Qt::Orientation axis)
{
    return axis == Qt::Vertical ? point.y() : point.x();
}

TABDROP_EXPORT qreal pointToSegmentDistance(const QPointF& point, const QLineF& segment);

/// Horizontal extent covered by @p frames, zero if empty
TABDROP_EXPORT qreal estimatedGridWidth(const QVector<QRectF>& frames);

/**
 * @brief Cell frames derived from cell size and spacing
 *
 * Used when the renderer has not measured its items yet, or the measurement
 * is stale (frame count differs from item count). Grids lay cells out row
 * major with @c columns per row, lists lay them out along @c axis.
 */
TABDROP_EXPORT QVector<QRectF> synthesizeFrames(const DropZoneGeometry& geometry);

/**
 * @brief Indicator strip for a list insertion boundary
 * @param boundaryOffset Boundary offset along the list axis
 * @param zoneSize Zone size in zone-local coordinates
 *
 * The strip is inset from both ends of the cross axis and centred on the
 * boundary. The cross-axis length never drops below one unit.
 */
TABDROP_EXPORT QRectF listIndicatorFrame(qreal boundaryOffset, const QSizeF& zoneSize, Qt::Orientation axis = Qt::Vertical,
                                         qreal inset = Defaults::IndicatorInset,
                                         qreal thickness = Defaults::IndicatorThickness);

/**
 * @brief Indicator strip for a zone with no items
 *
 * Placed at @p fraction of the zone's extent along the axis, at least
 * Defaults::MinimumIndicatorOffset from the leading edge.
 */
TABDROP_EXPORT QRectF emptyZoneIndicatorFrame(const QSizeF& zoneSize, Qt::Orientation axis = Qt::Vertical,
                                              qreal fraction = Defaults::EmptyZoneIndicatorFraction,
                                              qreal inset = Defaults::IndicatorInset,
                                              qreal thickness = Defaults::IndicatorThickness);

} // namespace BoundaryCalculator

} // namespace TabDrop
