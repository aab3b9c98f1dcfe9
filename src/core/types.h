// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLineF>
#include <QMetaType>
#include <QRectF>
#include <QVector>
#include <QtGlobal>

#include <optional>

namespace TabDrop {

/**
 * @brief Opaque identity of an on-screen window
 *
 * Hosts map their native window handle to this value. Zero means "no window".
 */
using WindowKey = quintptr;

/**
 * @brief A visible window and its frame in screen coordinates
 */
struct WindowInfo
{
    WindowKey key = 0;
    QRectF frame;
};

/**
 * @brief Orientation of a grid insertion boundary
 *
 * Horizontal boundaries sit between rows (or after a complete last row),
 * vertical boundaries sit between cells of one row.
 */
enum class BoundaryOrientation {
    Horizontal = 0,
    Vertical = 1
};

/**
 * @brief One insertion boundary of a grid-laid-out zone
 *
 * @c frame is the thin strip where the insertion indicator is drawn. Hit
 * testing uses the strip's centre line, see segment().
 */
struct GridBoundary
{
    int index = 0;
    BoundaryOrientation orientation = BoundaryOrientation::Vertical;
    QRectF frame;

    /// Centre line of the indicator strip
    QLineF segment() const
    {
        if (orientation == BoundaryOrientation::Horizontal) {
            const qreal y = frame.center().y();
            return QLineF(frame.left(), y, frame.right(), y);
        }
        const qreal x = frame.center().x();
        return QLineF(x, frame.top(), x, frame.bottom());
    }

    bool operator==(const GridBoundary& other) const
    {
        return index == other.index && orientation == other.orientation && frame == other.frame;
    }
};

/**
 * @brief Measured layout of one drop zone, pushed by the renderer
 *
 * A zone is a grid when @c columns is set, a linear list otherwise.
 * @c itemFrames are in zone-local coordinates and may be empty or stale; see
 * DropZoneRegistry::effectiveItemFrames().
 */
struct DropZoneGeometry
{
    WindowKey windowKey = 0;
    QRectF frame; // window-local
    qreal cellSize = 0.0;
    qreal spacing = 0.0;
    int itemCount = 0;
    std::optional<int> columns;
    Qt::Orientation axis = Qt::Vertical;
    QVector<QRectF> itemFrames;

    bool isGrid() const
    {
        return columns.has_value() && *columns > 0;
    }
};

/**
 * @brief Discrete feedback events for haptics, sound or highlight layers
 */
enum class FeedbackKind {
    DragBegan = 0,
    ZoneEntered = 1,
    InsertionChanged = 2,
    WindowBoundaryCrossed = 3,
    DroppedOutside = 4,
    Dropped = 5,
    Cancelled = 6
};

/**
 * @brief Visual style of the floating drag preview
 */
enum class PreviewStyle {
    TabRow = 0, ///< Full-width row, dragging from a list
    PinnedTile = 1, ///< Square tile, dragging from the essentials grid
    Ghost = 2 ///< Translucent, cursor is outside every window
};

} // namespace TabDrop

Q_DECLARE_METATYPE(TabDrop::FeedbackKind)
Q_DECLARE_METATYPE(TabDrop::PreviewStyle)
