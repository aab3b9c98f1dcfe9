// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "crosswindowcoordinator.h"
#include "droptargetadapter.h"
#include "../core/dragsession.h"
#include "../core/dropzoneregistry.h"
#include "../core/logging.h"
#include "../platform/dragpreviewwindow.h"

#include <cmath>

namespace TabDrop {

CrossWindowCoordinator::CrossWindowCoordinator(DragSession* session, DropZoneRegistry* registry, QObject* parent)
    : QObject(parent)
    , m_session(session)
    , m_registry(registry)
{
    Q_ASSERT(session && registry);

    connect(m_session, &DragSession::dragStarted, this, &CrossWindowCoordinator::onDragStarted);
    connect(m_session, &DragSession::dragEnded, this, &CrossWindowCoordinator::onDragEnded);
    connect(m_session, &DragSession::outsideWindowChanged, this, &CrossWindowCoordinator::updatePreview);
}

CrossWindowCoordinator::~CrossWindowCoordinator() = default;

void CrossWindowCoordinator::registerTarget(DropTargetAdapter* target)
{
    if (!target) {
        return;
    }
    const Container zone = target->zone();
    if (DropTargetAdapter* existing = targetFor(zone); existing && existing != target) {
        qCDebug(lcWindows) << "Replacing drop target for" << zone;
        if (m_hovered == existing) {
            existing->pointerExited();
            m_hovered.clear();
        }
    }
    m_targets.insert(zone, target);
}

void CrossWindowCoordinator::unregisterTarget(DropTargetAdapter* target)
{
    // May run from QObject::destroyed, so never dereference target here
    for (auto it = m_targets.begin(); it != m_targets.end();) {
        if (it.value().isNull() || it.value() == target) {
            it = m_targets.erase(it);
        } else {
            ++it;
        }
    }
    if (m_hovered == target) {
        m_hovered.clear();
    }
}

DropTargetAdapter* CrossWindowCoordinator::targetFor(const Container& zone) const
{
    return m_targets.value(zone).data();
}

QList<DropTargetAdapter*> CrossWindowCoordinator::targets() const
{
    QList<DropTargetAdapter*> result;
    for (const QPointer<DropTargetAdapter>& target : m_targets) {
        if (target) {
            result.append(target.data());
        }
    }
    return result;
}

QPointF CrossWindowCoordinator::zoneLocalPoint(const Container& zone) const
{
    return m_session->localCursor() - m_registry->geometry(zone).frame.topLeft();
}

void CrossWindowCoordinator::setHovered(DropTargetAdapter* target, const QPointF& zoneLocal)
{
    if (m_hovered == target) {
        if (target) {
            target->pointerMoved(zoneLocal);
        }
        return;
    }

    if (m_hovered) {
        m_hovered->pointerExited();
    }
    m_hovered = target;
    if (target) {
        target->pointerEntered(zoneLocal);
    }
}

void CrossWindowCoordinator::updateScreenPosition(const QPointF& screenPoint)
{
    if (!m_session || !m_session->isDragging()) {
        return;
    }
    if (!std::isfinite(screenPoint.x()) || !std::isfinite(screenPoint.y())) {
        qCWarning(lcWindows) << "Ignoring non-finite screen position" << screenPoint;
        return;
    }

    m_session->updateCursor(screenPoint);

    if (m_session->isOutsideWindow()) {
        setHovered(nullptr, QPointF());
    } else {
        const std::optional<Container> zone = m_registry->zoneAt(m_session->currentWindow(), m_session->localCursor());
        DropTargetAdapter* target = zone ? targetFor(*zone) : nullptr;
        setHovered(target, target ? zoneLocalPoint(*zone) : QPointF());
    }

    updatePreview();
}

bool CrossWindowCoordinator::release(const QPointF& screenPoint)
{
    if (!m_session || !m_session->isDragging()) {
        return false;
    }

    updateScreenPosition(screenPoint);

    if (m_session->isOutsideWindow()) {
        qCInfo(lcWindows) << "Released outside every window - cancelling";
        Q_EMIT feedbackRequested(FeedbackKind::DroppedOutside);
        setHovered(nullptr, QPointF());
        m_session->cancelDrag();
        return false;
    }

    if (m_hovered) {
        QPointer<DropTargetAdapter> target = m_hovered;
        m_hovered.clear();
        return target->drop(zoneLocalPoint(target->zone()));
    }

    qCInfo(lcWindows) << "Released over no drop zone - cancelling";
    m_session->cancelDrag();
    return false;
}

void CrossWindowCoordinator::cancel()
{
    setHovered(nullptr, QPointF());
    if (m_session) {
        m_session->cancelDrag();
    }
}

void CrossWindowCoordinator::setPreviewSize(const QSize& size)
{
    if (size.isValid() && !size.isEmpty()) {
        m_previewSize = size;
    }
}

void CrossWindowCoordinator::setPreviewWindowEnabled(bool enabled)
{
    m_previewWindowEnabled = enabled;
    if (!enabled && m_previewWindow) {
        m_previewWindow->hide();
    }
}

QRect CrossWindowCoordinator::previewGeometry() const
{
    if (!m_session) {
        return QRect();
    }

    const QPointF cursor = m_session->screenCursor();
    QRectF frame(QPointF(0, 0), QSizeF(m_previewSize));

    const bool cursorInSidebar = m_sidebarScreenFrame.width() > 0.0 && cursor.x() >= m_sidebarScreenFrame.left()
        && cursor.x() <= m_sidebarScreenFrame.right();
    if (m_centerInSidebar && cursorInSidebar && m_session->isSameZoneReorder()) {
        // Pin to the sidebar column so the row only slides vertically
        frame.moveCenter(QPointF(m_sidebarScreenFrame.center().x(), cursor.y()));
    } else {
        frame.moveCenter(cursor);
    }
    return frame.toRect();
}

PreviewStyle CrossWindowCoordinator::previewStyle() const
{
    if (!m_session || m_session->isOutsideWindow()) {
        return PreviewStyle::Ghost;
    }
    if (m_session->sourceZone().kind() == Container::Kind::Essentials) {
        return PreviewStyle::PinnedTile;
    }
    return PreviewStyle::TabRow;
}

void CrossWindowCoordinator::onDragStarted()
{
    if (m_previewWindowEnabled) {
        if (!m_previewWindow) {
            m_previewWindow = std::make_unique<DragPreviewWindow>();
            Q_EMIT previewWindowCreated(m_previewWindow.get());
        }
        m_previewWindow->setTabTitle(m_session->payload().title());
    }
    updatePreview();
}

void CrossWindowCoordinator::onDragEnded()
{
    m_hovered.clear();
    if (m_previewWindow) {
        m_previewWindow->hide();
    }
}

void CrossWindowCoordinator::updatePreview()
{
    if (!m_session || !m_session->isDragging()) {
        return;
    }

    const QRect geometry = previewGeometry();
    const PreviewStyle style = previewStyle();

    if (m_previewWindow && m_previewWindowEnabled) {
        m_previewWindow->setPreviewStyle(style);
        m_previewWindow->setGeometry(geometry);
        if (!m_previewWindow->isVisible()) {
            m_previewWindow->show();
        }
    }

    Q_EMIT previewChanged(geometry, style);
}

} // namespace TabDrop
