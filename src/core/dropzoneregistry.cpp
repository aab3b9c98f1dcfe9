// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dropzoneregistry.h"
#include "boundarycalculator.h"
#include "logging.h"

#include <cmath>

namespace TabDrop {

namespace {

bool isFiniteRect(const QRectF& rect)
{
    return std::isfinite(rect.x()) && std::isfinite(rect.y()) && std::isfinite(rect.width())
        && std::isfinite(rect.height());
}

} // anonymous namespace

DropZoneRegistry::DropZoneRegistry(QObject* parent)
    : QObject(parent)
{
}

DropZoneGeometry& DropZoneRegistry::entry(const Container& zone)
{
    auto it = m_zones.find(zone);
    if (it == m_zones.end()) {
        DropZoneGeometry geometry;
        geometry.cellSize = m_defaultCellSize;
        geometry.spacing = m_defaultSpacing;
        it = m_zones.insert(zone, geometry);
        m_registrationOrder.append(zone);
        qCDebug(lcZones) << "Registered zone" << zone;
    }
    return it.value();
}

void DropZoneRegistry::registerZoneFrame(const Container& zone, const QRectF& frame, WindowKey windowKey)
{
    if (!isFiniteRect(frame)) {
        qCWarning(lcZones) << "Ignoring non-finite frame for" << zone << frame;
        return;
    }

    DropZoneGeometry& geometry = entry(zone);
    if (geometry.frame == frame && geometry.windowKey == windowKey) {
        return;
    }
    if (geometry.windowKey != 0 && geometry.windowKey != windowKey) {
        qCDebug(lcZones) << "Zone" << zone << "moved from window" << geometry.windowKey << "to" << windowKey;
    }
    geometry.frame = frame;
    geometry.windowKey = windowKey;
    Q_EMIT zoneChanged(zone);
}

void DropZoneRegistry::registerZoneGeometry(const Container& zone, qreal cellSize, qreal spacing, int itemCount,
                                            std::optional<int> columns, Qt::Orientation axis)
{
    DropZoneGeometry& geometry = entry(zone);

    if (!std::isfinite(cellSize) || cellSize <= 0.0) {
        qCWarning(lcZones) << "Invalid cell size" << cellSize << "for" << zone << "- using" << m_defaultCellSize;
        cellSize = m_defaultCellSize;
    }
    if (!std::isfinite(spacing) || spacing < 0.0) {
        qCWarning(lcZones) << "Invalid spacing" << spacing << "for" << zone << "- using" << m_defaultSpacing;
        spacing = m_defaultSpacing;
    }
    if (itemCount < 0) {
        qCWarning(lcZones) << "Negative item count" << itemCount << "for" << zone;
        itemCount = 0;
    }
    if (columns && *columns < 1) {
        qCWarning(lcZones) << "Invalid column count" << *columns << "for" << zone << "- treating as list";
        columns.reset();
    }

    geometry.cellSize = cellSize;
    geometry.spacing = spacing;
    geometry.itemCount = itemCount;
    geometry.columns = columns;
    geometry.axis = axis;
    Q_EMIT zoneChanged(zone);
}

void DropZoneRegistry::registerItemFrames(const Container& zone, const QVector<QRectF>& frames)
{
    for (const QRectF& frame : frames) {
        if (!isFiniteRect(frame)) {
            qCWarning(lcZones) << "Ignoring item frames with a non-finite entry for" << zone;
            return;
        }
    }

    DropZoneGeometry& geometry = entry(zone);
    geometry.itemFrames = frames;
    Q_EMIT zoneChanged(zone);
}

void DropZoneRegistry::unregisterZone(const Container& zone)
{
    if (m_zones.remove(zone) > 0) {
        m_registrationOrder.removeAll(zone);
        qCDebug(lcZones) << "Unregistered zone" << zone;
        Q_EMIT zoneRemoved(zone);
    }
}

void DropZoneRegistry::clear()
{
    const QList<Container> removed = m_registrationOrder;
    m_zones.clear();
    m_registrationOrder.clear();
    for (const Container& zone : removed) {
        Q_EMIT zoneRemoved(zone);
    }
}

DropZoneGeometry DropZoneRegistry::geometry(const Container& zone) const
{
    auto it = m_zones.constFind(zone);
    if (it != m_zones.constEnd()) {
        return it.value();
    }

    DropZoneGeometry geometry;
    geometry.cellSize = m_defaultCellSize;
    geometry.spacing = m_defaultSpacing;
    return geometry;
}

QVector<QRectF> DropZoneRegistry::effectiveItemFrames(const Container& zone) const
{
    const DropZoneGeometry zoneGeometry = geometry(zone);
    if (zoneGeometry.itemFrames.size() == zoneGeometry.itemCount) {
        return zoneGeometry.itemFrames;
    }

    qCDebug(lcZones) << "Zone" << zone << "has" << zoneGeometry.itemFrames.size() << "measured frames for"
                     << zoneGeometry.itemCount << "items - synthesizing";
    return BoundaryCalculator::synthesizeFrames(zoneGeometry);
}

std::optional<Container> DropZoneRegistry::zoneAt(WindowKey windowKey, const QPointF& windowPoint) const
{
    // Smallest frame wins; among equal areas, the most recently registered zone
    std::optional<Container> best;
    qreal bestArea = 0.0;
    for (const Container& zone : m_registrationOrder) {
        const DropZoneGeometry geometry = m_zones.value(zone);
        if (geometry.windowKey != windowKey || !geometry.frame.contains(windowPoint)) {
            continue;
        }
        const qreal area = geometry.frame.width() * geometry.frame.height();
        if (!best || area <= bestArea) {
            best = zone;
            bestArea = area;
        }
    }
    return best;
}

void DropZoneRegistry::setDefaultCellSize(qreal cellSize)
{
    if (std::isfinite(cellSize) && cellSize > 0.0) {
        m_defaultCellSize = cellSize;
    }
}

void DropZoneRegistry::setDefaultSpacing(qreal spacing)
{
    if (std::isfinite(spacing) && spacing >= 0.0) {
        m_defaultSpacing = spacing;
    }
}

} // namespace TabDrop
