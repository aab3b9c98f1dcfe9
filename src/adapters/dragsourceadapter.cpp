// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dragsourceadapter.h"
#include "crosswindowcoordinator.h"
#include "../core/draglock.h"
#include "../core/dragsession.h"
#include "../core/logging.h"

#include <QDrag>
#include <QMetaObject>
#include <QMimeData>
#include <QUuid>

namespace TabDrop {

DragSourceAdapter::DragSourceAdapter(DragSession* session, DragLock* lock, QObject* parent)
    : QObject(parent)
    , m_session(session)
    , m_lock(lock)
{
    Q_ASSERT(session && lock);

    // Ending for any reason (drop, cancel, release outside) frees the lock
    connect(m_session, &DragSession::dragEnded, this, [this]() {
        releaseLock();
    });
}

DragSourceAdapter::~DragSourceAdapter()
{
    if (ownsDrag() && m_session) {
        qCDebug(lcSource) << "Source destroyed mid-drag - cancelling";
        m_session->cancelDrag();
    }
    releaseLock();
}

void DragSourceAdapter::setLocation(const Container& container, int index)
{
    m_container = container;
    m_index = index;
}

void DragSourceAdapter::setSourceBounds(WindowKey windowKey, const QRectF& bounds)
{
    m_windowKey = windowKey;
    m_bounds = bounds;
}

bool DragSourceAdapter::hitTest(WindowKey windowKey, const QPointF& windowPoint) const
{
    return windowKey == m_windowKey && m_bounds.contains(windowPoint);
}

bool DragSourceAdapter::ownsDrag() const
{
    return m_lock && !m_ownerToken.isEmpty() && m_lock->owner() == m_ownerToken;
}

bool DragSourceAdapter::acquireAndBegin(const char* path)
{
    if (!m_session || !m_lock) {
        return false;
    }
    if (!m_payload.isValid()) {
        qCWarning(lcSource) << path << "drag refused - source has no tab id";
        return false;
    }

    const QString token = QUuid::createUuid().toString(QUuid::WithoutBraces);
    if (!m_lock->tryAcquire(token)) {
        qCDebug(lcSource) << path << "drag yielded -" << m_lock->debugInfo();
        Q_EMIT dragRejected();
        return false;
    }
    m_ownerToken = token;

    if (!m_session->beginDrag(m_payload, m_container, m_index)) {
        // A session outlived its lock; don't hold the lock for it
        qCWarning(lcSource) << path << "drag refused - session already open";
        releaseLock();
        Q_EMIT dragRejected();
        return false;
    }

    qCInfo(lcSource) << path << "drag started for" << m_payload.tabId() << "at" << m_container << m_index;
    Q_EMIT dragInitiated();
    return true;
}

void DragSourceAdapter::releaseLock()
{
    if (m_ownerToken.isEmpty()) {
        return;
    }
    if (m_lock) {
        m_lock->release(m_ownerToken);
    }
    m_ownerToken.clear();
}

std::unique_ptr<QMimeData> DragSourceAdapter::startNativeDrag()
{
    if (!acquireAndBegin("Native")) {
        return nullptr;
    }
    return m_payload.toMimeData();
}

QDrag* DragSourceAdapter::createNativeDrag(QObject* dragSource)
{
    std::unique_ptr<QMimeData> mimeData = startNativeDrag();
    if (!mimeData) {
        return nullptr;
    }

    auto* drag = new QDrag(dragSource);
    drag->setMimeData(mimeData.release());
    return drag;
}

void DragSourceAdapter::nativeDragMoved(const QPointF& screenPoint)
{
    // Platform drag managers may report from their own thread
    QMetaObject::invokeMethod(
        this,
        [this, screenPoint]() {
            if (!ownsDrag()) {
                return;
            }
            if (m_coordinator) {
                m_coordinator->updateScreenPosition(screenPoint);
            } else if (m_session) {
                m_session->updateCursor(screenPoint);
            }
        },
        Qt::AutoConnection);
}

void DragSourceAdapter::nativeDragFinished(Qt::DropAction action)
{
    const bool accepted = action != Qt::IgnoreAction;
    if (ownsDrag() && m_session && m_session->isDragging()) {
        if (!accepted && m_session->isOutsideWindow() && m_coordinator) {
            // No window saw the release, so no QDropEvent reached the coordinator
            qCInfo(lcSource) << "Native drag released outside every window";
            m_coordinator->release(m_session->screenCursor());
        } else {
            if (accepted) {
                // The target accepted but didn't finish the session
                qCDebug(lcSource) << "Native drag accepted without a commit - closing session";
            } else {
                qCInfo(lcSource) << "Native drag rejected - cancelling";
            }
            m_session->cancelDrag();
        }
    }
    releaseLock();
    Q_EMIT dragFinished(accepted);
}

bool DragSourceAdapter::startGestureDrag()
{
    return acquireAndBegin("Gesture");
}

void DragSourceAdapter::gestureEnded(bool accepted)
{
    if (ownsDrag() && m_session && m_session->isDragging()) {
        qCDebug(lcSource) << "Gesture ended with the session still open - cancelling";
        m_session->cancelDrag();
    }
    releaseLock();
    Q_EMIT dragFinished(accepted);
}

} // namespace TabDrop
