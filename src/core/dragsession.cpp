// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dragsession.h"
#include "boundarycalculator.h"
#include "dropzoneregistry.h"
#include "interfaces.h"
#include "logging.h"

#include <algorithm>
#include <cmath>

namespace TabDrop {

DragSession::DragSession(DropZoneRegistry* registry, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
{
    Q_ASSERT(m_registry);
}

bool DragSession::beginDrag(const DragPayload& payload, const Container& sourceZone, int sourceIndex)
{
    if (m_state != State::Idle) {
        qCDebug(lcSession) << "beginDrag ignored - session already open for" << m_payload.tabId();
        return false;
    }
    if (sourceIndex < 0) {
        qCWarning(lcSession) << "beginDrag rejected - negative source index" << sourceIndex;
        return false;
    }

    m_payload = payload;
    m_sourceZone = sourceZone;
    m_sourceIndex = sourceIndex;
    m_insertionIndex.clear();
    m_outsideWindow = false;
    m_locator.reset();
    m_activeZone = sourceZone;

    qCInfo(lcSession) << "Drag began:" << payload.tabId() << "from" << sourceZone << "index" << sourceIndex;

    setState(State::Dragging);
    Q_EMIT activeZoneChanged();
    Q_EMIT dragStarted(m_payload, m_sourceZone, m_sourceIndex);
    Q_EMIT feedbackRequested(FeedbackKind::DragBegan);
    return true;
}

void DragSession::updateCursor(const QPointF& screenPoint)
{
    if (!isDragging()) {
        return;
    }
    if (!std::isfinite(screenPoint.x()) || !std::isfinite(screenPoint.y())) {
        qCWarning(lcSession) << "Ignoring non-finite cursor position" << screenPoint;
        return;
    }

    m_screenCursor = screenPoint;

    WindowHit hit;
    if (m_windowProvider) {
        hit = m_locator.locate(screenPoint, m_windowProvider->visibleWindows());
    } else {
        hit.inside = true;
        hit.localPoint = screenPoint;
    }

    m_currentWindow = hit.key;
    m_localCursor = hit.localPoint;

    const bool outside = !hit.inside;
    if (outside != m_outsideWindow) {
        m_outsideWindow = outside;
        qCDebug(lcSession) << (outside ? "Cursor left all windows" : "Cursor entered window") << hit.key;
        if (outside) {
            setActiveZone(std::nullopt);
        }
        Q_EMIT outsideWindowChanged(outside);
        Q_EMIT feedbackRequested(FeedbackKind::WindowBoundaryCrossed);
    }

    Q_EMIT cursorMoved(screenPoint);
}

void DragSession::enterZone(const Container& zone)
{
    if (!isDragging()) {
        return;
    }
    if (m_activeZone == zone) {
        return;
    }

    m_insertionIndex.remove(zone);
    setActiveZone(zone);
    qCDebug(lcSession) << "Entered zone" << zone;
    Q_EMIT feedbackRequested(FeedbackKind::ZoneEntered);
}

void DragSession::exitZone(const Container& zone)
{
    if (!isDragging()) {
        return;
    }

    m_insertionIndex.remove(zone);
    if (m_activeZone == zone) {
        qCDebug(lcSession) << "Exited zone" << zone;
        setActiveZone(std::nullopt);
    }
}

std::optional<int> DragSession::updateInsertionIndex(const Container& zone, const QPointF& localPoint, bool isGrid)
{
    if (!isDragging()) {
        return std::nullopt;
    }
    if (!std::isfinite(localPoint.x()) || !std::isfinite(localPoint.y())) {
        qCWarning(lcSession) << "Ignoring non-finite zone point" << localPoint << "for" << zone;
        return insertionIndex(zone);
    }

    const DropZoneGeometry geometry = m_registry->geometry(zone);
    const QVector<QRectF> frames = m_registry->effectiveItemFrames(zone);

    int index = 0;
    if (isGrid && geometry.isGrid()) {
        const qreal width = geometry.frame.width() > 0.0 ? geometry.frame.width()
                                                         : BoundaryCalculator::estimatedGridWidth(frames);
        const QVector<GridBoundary> boundaries =
            BoundaryCalculator::computeGridBoundaries(frames, *geometry.columns, width, geometry.spacing);
        index = BoundaryCalculator::resolveInsertionIndex(localPoint, boundaries);
    } else {
        const QVector<qreal> boundaries = BoundaryCalculator::computeListBoundaries(frames, geometry.axis);
        index = BoundaryCalculator::resolveInsertionIndex(BoundaryCalculator::axisPosition(localPoint, geometry.axis),
                                                          boundaries);
    }

    // Measurements can lag the item count; never hand out an index past it
    const int count = geometry.itemCount;
    const int maxIndex = (zone == m_sourceZone) ? std::max(0, count - 1) : count;
    index = std::clamp(index, 0, maxIndex);

    auto it = m_insertionIndex.find(zone);
    if (it != m_insertionIndex.end() && it.value() == index) {
        return index;
    }

    m_insertionIndex.insert(zone, index);
    qCDebug(lcSession) << "Insertion index for" << zone << "->" << index;
    Q_EMIT insertionIndexChanged(zone, index);
    Q_EMIT feedbackRequested(FeedbackKind::InsertionChanged);
    return index;
}

std::optional<PendingMove> DragSession::completeDrop(const Container& targetZone, int targetIndex)
{
    if (!isDragging()) {
        qCDebug(lcSession) << "completeDrop ignored - no active drag";
        return std::nullopt;
    }

    std::optional<PendingMove> move;
    if (targetZone != m_sourceZone) {
        PendingMove pending;
        pending.payload = m_payload;
        pending.sourceZone = m_sourceZone;
        pending.sourceIndex = m_sourceIndex;
        pending.targetZone = targetZone;
        pending.targetIndex = std::max(0, targetIndex);
        pending.isReorder = false;
        pending.sequence = ++m_commitSequence;
        move = pending;
        qCInfo(lcSession) << "Drop staged:" << m_sourceZone << "#" << m_sourceIndex << "->" << targetZone << "#"
                          << pending.targetIndex;
    } else {
        qCDebug(lcSession) << "Drop onto source zone" << targetZone << "- nothing staged";
    }

    setState(State::Committing);
    Q_EMIT feedbackRequested(FeedbackKind::Dropped);
    clear();
    Q_EMIT dragEnded(false);
    return move;
}

std::optional<PendingMove> DragSession::completeReorder()
{
    if (!isDragging()) {
        qCDebug(lcSession) << "completeReorder ignored - no active drag";
        return std::nullopt;
    }

    std::optional<PendingMove> move;
    const std::optional<int> target = insertionIndex(m_sourceZone);
    if (target && *target != m_sourceIndex) {
        PendingMove pending;
        pending.payload = m_payload;
        pending.sourceZone = m_sourceZone;
        pending.sourceIndex = m_sourceIndex;
        pending.targetZone = m_sourceZone;
        pending.targetIndex = *target;
        pending.isReorder = true;
        pending.sequence = ++m_commitSequence;
        move = pending;
        qCInfo(lcSession) << "Reorder staged in" << m_sourceZone << ":" << m_sourceIndex << "->" << *target;
    } else {
        qCDebug(lcSession) << "Reorder released at its origin - nothing staged";
    }

    setState(State::Committing);
    Q_EMIT feedbackRequested(FeedbackKind::Dropped);
    clear();
    Q_EMIT dragEnded(false);
    return move;
}

void DragSession::cancelDrag()
{
    if (m_state == State::Idle) {
        return;
    }

    qCInfo(lcSession) << "Drag cancelled:" << m_payload.tabId();
    setState(State::Cancelled);
    Q_EMIT feedbackRequested(FeedbackKind::Cancelled);
    clear();
    Q_EMIT dragCancelled();
    Q_EMIT dragEnded(true);
}

std::optional<int> DragSession::insertionIndex(const Container& zone) const
{
    auto it = m_insertionIndex.constFind(zone);
    if (it == m_insertionIndex.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool DragSession::isSameZoneReorder() const
{
    if (!isDragging() || m_activeZone != m_sourceZone) {
        return false;
    }
    return m_sourceZone.kind() != Container::Kind::Essentials;
}

qreal DragSession::reorderOffset(const Container& zone, int index) const
{
    if (!isDragging() || zone != m_sourceZone || m_activeZone != zone) {
        return 0.0;
    }

    const std::optional<int> target = insertionIndex(zone);
    if (!target || *target == m_sourceIndex) {
        return 0.0;
    }

    const DropZoneGeometry geometry = m_registry->geometry(zone);
    const qreal step = geometry.cellSize + geometry.spacing;

    if (m_sourceIndex < *target) {
        if (index > m_sourceIndex && index <= *target) {
            return -step;
        }
    } else if (index >= *target && index < m_sourceIndex) {
        return step;
    }
    return 0.0;
}

void DragSession::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    Q_EMIT stateChanged(state);
}

void DragSession::setActiveZone(const std::optional<Container>& zone)
{
    if (m_activeZone == zone) {
        return;
    }
    m_activeZone = zone;
    Q_EMIT activeZoneChanged();
}

void DragSession::clear()
{
    m_payload = DragPayload();
    m_sourceZone = Container();
    m_sourceIndex = -1;
    m_insertionIndex.clear();
    m_localCursor = QPointF();
    m_currentWindow = 0;
    m_locator.reset();

    const bool wasOutside = m_outsideWindow;
    m_outsideWindow = false;
    setActiveZone(std::nullopt);
    setState(State::Idle);
    if (wasOutside) {
        Q_EMIT outsideWindowChanged(false);
    }
}

} // namespace TabDrop
