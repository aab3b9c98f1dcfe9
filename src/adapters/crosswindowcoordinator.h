// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/constants.h"
#include "../core/container.h"
#include "../core/types.h"
#include "tabdrop_export.h"
#include <QHash>
#include <QList>
#include <QObject>
#include <QPointF>
#include <QPointer>
#include <QRect>
#include <QRectF>
#include <QSize>

#include <memory>

namespace TabDrop {

class DragPreviewWindow;
class DragSession;
class DropTargetAdapter;
class DropZoneRegistry;

/**
 * @brief Screen-space driver of a drag across windows
 *
 * Takes screen positions from whichever path owns the drag, lets the session
 * resolve the window under the cursor, finds the registered zone under the
 * window-local point and routes enter/move/exit to that zone's drop target.
 *
 * Also owns the floating preview. It is positioned purely from screen
 * coordinates so it is independent of any single window's lifetime.
 */
class TABDROP_EXPORT CrossWindowCoordinator : public QObject
{
    Q_OBJECT

public:
    CrossWindowCoordinator(DragSession* session, DropZoneRegistry* registry, QObject* parent = nullptr);
    ~CrossWindowCoordinator() override;

    void registerTarget(DropTargetAdapter* target);
    void unregisterTarget(DropTargetAdapter* target);
    DropTargetAdapter* targetFor(const Container& zone) const;
    QList<DropTargetAdapter*> targets() const;

    void updateScreenPosition(const QPointF& screenPoint);

    /**
     * @brief Pointer released at @p screenPoint
     * @return true if a drop target took the release
     *
     * Outside every window, or over no recognized zone, the drag is cancelled
     * and nothing is committed.
     */
    bool release(const QPointF& screenPoint);

    void cancel();

    DropTargetAdapter* hoveredTarget() const { return m_hovered; }

    // ═══════════════════════════════════════════════════════════════════════════
    // Preview
    // ═══════════════════════════════════════════════════════════════════════════

    /// Screen frame of the sidebar, used to centre the preview while reordering
    void setSidebarScreenFrame(const QRectF& frame) { m_sidebarScreenFrame = frame; }
    QRectF sidebarScreenFrame() const { return m_sidebarScreenFrame; }

    void setPreviewSize(const QSize& size);
    QSize previewSize() const { return m_previewSize; }
    void setCenterPreviewInSidebar(bool center) { m_centerInSidebar = center; }
    bool centerPreviewInSidebar() const { return m_centerInSidebar; }

    /// Create and show the floating preview surface during drags
    void setPreviewWindowEnabled(bool enabled);
    bool isPreviewWindowEnabled() const { return m_previewWindowEnabled; }
    DragPreviewWindow* previewWindow() const { return m_previewWindow.get(); }

    QRect previewGeometry() const;
    PreviewStyle previewStyle() const;

Q_SIGNALS:
    void previewChanged(const QRect& geometry, TabDrop::PreviewStyle style);
    void feedbackRequested(TabDrop::FeedbackKind kind);
    void previewWindowCreated(TabDrop::DragPreviewWindow* window);

private:
    QPointF zoneLocalPoint(const Container& zone) const;
    void setHovered(DropTargetAdapter* target, const QPointF& zoneLocal);
    void onDragStarted();
    void onDragEnded();
    void updatePreview();

    QPointer<DragSession> m_session;
    QPointer<DropZoneRegistry> m_registry;
    QHash<Container, QPointer<DropTargetAdapter>> m_targets;
    QPointer<DropTargetAdapter> m_hovered;

    QRectF m_sidebarScreenFrame;
    QSize m_previewSize{Defaults::PreviewWidth, Defaults::PreviewHeight};
    bool m_centerInSidebar = true;
    bool m_previewWindowEnabled = false;
    std::unique_ptr<DragPreviewWindow> m_previewWindow;
};

} // namespace TabDrop
