// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "constants.h"
#include "container.h"
#include "tabdrop_export.h"
#include "types.h"
#include <QHash>
#include <QList>
#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QVector>

#include <optional>

namespace TabDrop {

/**
 * @brief Measured geometry of every drop zone, keyed by container
 *
 * The renderer pushes geometry on each layout pass; the engine never pulls.
 * A zone registered from a second window replaces the first registration,
 * which keeps one container mapped to exactly one on-screen region.
 *
 * Item counts and measured frames may briefly disagree while a layout pass
 * is in flight. effectiveItemFrames() never hands out frames that disagree
 * with the item count.
 */
class TABDROP_EXPORT DropZoneRegistry : public QObject
{
    Q_OBJECT

public:
    explicit DropZoneRegistry(QObject* parent = nullptr);

    /**
     * @brief Register or move the zone's frame
     * @param frame Zone rectangle in window-local coordinates
     * @param windowKey Window hosting the zone
     */
    void registerZoneFrame(const Container& zone, const QRectF& frame, WindowKey windowKey = 0);

    /**
     * @brief Register layout parameters
     * @param columns Set for grid zones, nullopt for linear lists
     */
    void registerZoneGeometry(const Container& zone, qreal cellSize, qreal spacing, int itemCount,
                              std::optional<int> columns = std::nullopt, Qt::Orientation axis = Qt::Vertical);

    /// Measured item frames in zone-local coordinates, in item order
    void registerItemFrames(const Container& zone, const QVector<QRectF>& frames);

    void unregisterZone(const Container& zone);
    void clear();

    bool contains(const Container& zone) const { return m_zones.contains(zone); }
    /// Registered zones, oldest first
    QList<Container> zones() const { return m_registrationOrder; }

    /**
     * @brief Geometry for @p zone
     *
     * An unregistered zone yields an empty list geometry using the default
     * cell size and spacing.
     */
    DropZoneGeometry geometry(const Container& zone) const;

    /// Measured frames if they match the item count, synthesized frames otherwise
    QVector<QRectF> effectiveItemFrames(const Container& zone) const;

    /**
     * @brief Zone under a window-local point
     *
     * When zones nest, the smallest containing frame wins. Frames of equal
     * area resolve to the most recently registered zone.
     */
    std::optional<Container> zoneAt(WindowKey windowKey, const QPointF& windowPoint) const;

    qreal defaultCellSize() const { return m_defaultCellSize; }
    void setDefaultCellSize(qreal cellSize);
    qreal defaultSpacing() const { return m_defaultSpacing; }
    void setDefaultSpacing(qreal spacing);

Q_SIGNALS:
    void zoneChanged(const TabDrop::Container& zone);
    void zoneRemoved(const TabDrop::Container& zone);

private:
    DropZoneGeometry& entry(const Container& zone);

    QHash<Container, DropZoneGeometry> m_zones;
    QList<Container> m_registrationOrder;
    qreal m_defaultCellSize = Defaults::CellSize;
    qreal m_defaultSpacing = Defaults::CellSpacing;
};

} // namespace TabDrop
