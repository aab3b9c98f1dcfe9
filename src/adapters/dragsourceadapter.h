// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/container.h"
#include "../core/dragpayload.h"
#include "../core/types.h"
#include "tabdrop_export.h"
#include <QObject>
#include <QPointF>
#include <QPointer>
#include <QRectF>
#include <QString>

#include <memory>

class QDrag;
class QMimeData;

namespace TabDrop {

class CrossWindowCoordinator;
class DragLock;
class DragSession;

/**
 * @brief Makes one rendered tab draggable
 *
 * Two initiation paths converge here:
 * - Native: the host's drag-start callback calls startNativeDrag() or
 *   createNativeDrag() and forwards the platform drag's movement and
 *   completion through nativeDragMoved()/nativeDragFinished().
 * - Gesture: PointerGestureMonitor calls startGestureDrag() once the press
 *   has moved past the threshold, and gestureEnded() on release.
 *
 * Both must win the DragLock before opening the session. Each attempt uses a
 * fresh owner token, so a late release from an earlier attempt can't evict a
 * newer one. The lock is released on every terminal event, including the
 * session ending for reasons this adapter didn't see.
 */
class TABDROP_EXPORT DragSourceAdapter : public QObject
{
    Q_OBJECT

public:
    DragSourceAdapter(DragSession* session, DragLock* lock, QObject* parent = nullptr);
    ~DragSourceAdapter() override;

    // Item identity, updated by the renderer as the list changes
    void setPayload(const DragPayload& payload) { m_payload = payload; }
    DragPayload payload() const { return m_payload; }
    void setLocation(const Container& container, int index);
    Container container() const { return m_container; }
    int index() const { return m_index; }

    /**
     * @brief Hit area for the pointer-gesture path
     * @param bounds Item rectangle in window-local coordinates
     */
    void setSourceBounds(WindowKey windowKey, const QRectF& bounds);
    WindowKey windowKey() const { return m_windowKey; }
    QRectF sourceBounds() const { return m_bounds; }
    bool hitTest(WindowKey windowKey, const QPointF& windowPoint) const;

    /// Route native drag movement through the coordinator instead of the bare session
    void setCoordinator(CrossWindowCoordinator* coordinator) { m_coordinator = coordinator; }

    // ═══════════════════════════════════════════════════════════════════════════
    // Native path
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Acquire the lock, open the session and encode the pasteboard item
     * @return nullptr if another path already owns the drag
     */
    std::unique_ptr<QMimeData> startNativeDrag();

    /**
     * @brief startNativeDrag() wrapped in a QDrag
     * @return An un-executed QDrag parented to @p dragSource, or nullptr if the lock was lost
     */
    QDrag* createNativeDrag(QObject* dragSource);

    /// Platform drag movement. May be called from any thread.
    void nativeDragMoved(const QPointF& screenPoint);

    /**
     * @brief Platform drag completion
     *
     * Qt::IgnoreAction cancels an unfinished session. When the cursor was last
     * seen outside every window the end goes through the coordinator, so the
     * drop-outside feedback fires as it does for a gesture release.
     */
    void nativeDragFinished(Qt::DropAction action);

    // ═══════════════════════════════════════════════════════════════════════════
    // Gesture path
    // ═══════════════════════════════════════════════════════════════════════════

    bool startGestureDrag();

    /// @param accepted Whether a drop target took the release
    void gestureEnded(bool accepted);

    /// Whether this adapter currently holds the drag lock
    bool ownsDrag() const;

Q_SIGNALS:
    void dragInitiated();
    void dragRejected();
    void dragFinished(bool accepted);

private:
    bool acquireAndBegin(const char* path);
    void releaseLock();

    QPointer<DragSession> m_session;
    QPointer<DragLock> m_lock;
    QPointer<CrossWindowCoordinator> m_coordinator;

    DragPayload m_payload;
    Container m_container;
    int m_index = 0;
    WindowKey m_windowKey = 0;
    QRectF m_bounds;

    QString m_ownerToken; ///< Token of the current attempt, empty when idle
};

} // namespace TabDrop
