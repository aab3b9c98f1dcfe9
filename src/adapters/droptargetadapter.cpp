// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "droptargetadapter.h"
#include "../core/boundarycalculator.h"
#include "../core/commitemitter.h"
#include "../core/dragsession.h"
#include "../core/dropzoneregistry.h"
#include "../core/logging.h"

#include <cmath>

namespace TabDrop {

DropTargetAdapter::DropTargetAdapter(const Container& zone, DragSession* session, DropZoneRegistry* registry,
                                     CommitEmitter* emitter, QObject* parent)
    : QObject(parent)
    , m_zone(zone)
    , m_session(session)
    , m_registry(registry)
    , m_emitter(emitter)
{
    Q_ASSERT(session && registry && emitter);

    // Cancel or a drop elsewhere leaves nothing for this zone to show
    connect(m_session, &DragSession::dragEnded, this, &DropTargetAdapter::clearLocalState);
}

bool DropTargetAdapter::acceptsUpdate(const QPointF& localPoint) const
{
    if (!m_session || !m_registry || !m_session->isDragging()) {
        return false;
    }
    if (!std::isfinite(localPoint.x()) || !std::isfinite(localPoint.y())) {
        qCWarning(lcTarget) << "Rejecting non-finite point" << localPoint << "in" << m_zone;
        return false;
    }
    return true;
}

void DropTargetAdapter::pointerEntered(const QPointF& localPoint)
{
    if (!acceptsUpdate(localPoint)) {
        return;
    }
    m_session->enterZone(m_zone);
    setHighlighted(true);
    updateTarget(localPoint);
}

void DropTargetAdapter::pointerMoved(const QPointF& localPoint)
{
    if (!acceptsUpdate(localPoint)) {
        return;
    }
    // Re-entry without an explicit enter, e.g. coming back from outside every window
    if (m_session->activeZone() != m_zone) {
        m_session->enterZone(m_zone);
    }
    setHighlighted(true);
    updateTarget(localPoint);
}

void DropTargetAdapter::pointerExited()
{
    if (m_session && m_session->isDragging()) {
        m_session->exitZone(m_zone);
    }
    clearLocalState();
}

bool DropTargetAdapter::drop(const QPointF& localPoint)
{
    if (!m_session || !m_session->isDragging()) {
        qCDebug(lcTarget) << "Drop on" << m_zone << "ignored - no active drag";
        clearLocalState();
        return false;
    }

    // Final index from the release position, if it's usable
    if (acceptsUpdate(localPoint)) {
        updateTarget(localPoint);
    }

    std::optional<PendingMove> move;
    if (m_session->sourceZone() == m_zone) {
        move = m_session->completeReorder();
    } else {
        const int index = m_session->insertionIndex(m_zone).value_or(0);
        move = m_session->completeDrop(m_zone, index);
    }

    bool committed = false;
    if (move && m_emitter) {
        committed = m_emitter->emitCommit(*move);
    }

    qCDebug(lcTarget) << "Drop on" << m_zone << (committed ? "committed" : "staged nothing");
    clearLocalState();
    Q_EMIT dropped(committed);
    return true;
}

void DropTargetAdapter::updateTarget(const QPointF& localPoint)
{
    const std::optional<int> index = m_session->updateInsertionIndex(m_zone, localPoint, true);
    if (!index || *index < 0) {
        return;
    }

    QRectF frame = computeIndicatorFrame(*index);
    if (m_overlayMapper) {
        frame = m_overlayMapper(frame);
    }

    if (m_indicatorFrame != frame) {
        m_indicatorFrame = frame;
        Q_EMIT indicatorFrameChanged(frame);
    }
}

QRectF DropTargetAdapter::computeIndicatorFrame(int index) const
{
    const DropZoneGeometry geometry = m_registry->geometry(m_zone);
    const QVector<QRectF> frames = m_registry->effectiveItemFrames(m_zone);

    if (frames.isEmpty()) {
        if (m_fallbackFrame) {
            return m_fallbackFrame();
        }
        return BoundaryCalculator::emptyZoneIndicatorFrame(geometry.frame.size(), geometry.axis, m_emptyFraction,
                                                           m_indicatorInset, m_indicatorThickness);
    }

    if (geometry.isGrid()) {
        const qreal width = geometry.frame.width() > 0.0 ? geometry.frame.width()
                                                         : BoundaryCalculator::estimatedGridWidth(frames);
        const QVector<GridBoundary> boundaries =
            BoundaryCalculator::computeGridBoundaries(frames, *geometry.columns, width, geometry.spacing);
        for (const GridBoundary& boundary : boundaries) {
            if (boundary.index == index) {
                return boundary.frame;
            }
        }
        return QRectF();
    }

    const QVector<qreal> boundaries = BoundaryCalculator::computeListBoundaries(frames, geometry.axis);
    const qreal offset = index < boundaries.size() ? boundaries[index] : boundaries.last();
    return BoundaryCalculator::listIndicatorFrame(offset, geometry.frame.size(), geometry.axis, m_indicatorInset,
                                                  m_indicatorThickness);
}

void DropTargetAdapter::setHighlighted(bool highlighted)
{
    if (m_highlighted == highlighted) {
        return;
    }
    m_highlighted = highlighted;
    Q_EMIT highlightedChanged(highlighted);
}

void DropTargetAdapter::clearLocalState()
{
    setHighlighted(false);
    if (m_indicatorFrame) {
        m_indicatorFrame.reset();
        Q_EMIT indicatorCleared();
    }
}

} // namespace TabDrop
