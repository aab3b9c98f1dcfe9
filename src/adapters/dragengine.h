// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/container.h"
#include "../core/dragoperation.h"
#include "../core/dragpayload.h"
#include "../core/types.h"
#include "tabdrop_export.h"
#include <QObject>
#include <QPointer>

#include <memory>

namespace TabDrop {

class CommitEmitter;
class CrossWindowCoordinator;
class DragLock;
class DragSession;
class DragSourceAdapter;
class DropTargetAdapter;
class DropZoneRegistry;
class GuiWindowProvider;
class IDragSettings;
class ITabOwner;
class IWindowProvider;
class PointerGestureMonitor;

/**
 * @brief Wires one complete drag engine together
 *
 * Owns the lock, zone registry, session, commit emitter, cross-window
 * coordinator and pointer monitor, and hands out drag sources and drop
 * targets bound to them. Settings are applied on construction and again on
 * every settingsChanged().
 *
 * Collaborators passed in are not owned. Without a window provider the
 * engine enumerates the application's own QWindows.
 */
class TABDROP_EXPORT DragEngine : public QObject
{
    Q_OBJECT

public:
    DragEngine(IDragSettings* settings, IWindowProvider* windowProvider, ITabOwner* tabOwner,
               QObject* parent = nullptr);
    ~DragEngine() override;

    /**
     * @brief Drag source for one rendered tab
     *
     * The caller owns the result (through @p parent or directly). It is
     * registered with the pointer monitor until destroyed.
     */
    DragSourceAdapter* createDragSource(const DragPayload& payload, const Container& container, int index,
                                        QObject* parent = nullptr);

    /**
     * @brief Drop target for @p zone
     *
     * Registered with the coordinator until destroyed. Creating a second
     * target for the same zone replaces the first.
     */
    DropTargetAdapter* createDropTarget(const Container& zone, QObject* parent = nullptr);

    DragLock* lock() const { return m_lock; }
    DropZoneRegistry* registry() const { return m_registry; }
    DragSession* session() const { return m_session; }
    CommitEmitter* emitter() const { return m_emitter; }
    CrossWindowCoordinator* coordinator() const { return m_coordinator; }
    PointerGestureMonitor* monitor() const { return m_monitor; }
    IWindowProvider* windowProvider() const { return m_windowProvider; }

    bool isFeedbackEnabled() const { return m_feedbackEnabled; }

public Q_SLOTS:
    void applySettings();

Q_SIGNALS:
    /// Feedback events, suppressed when feedback is disabled in settings
    void feedback(TabDrop::FeedbackKind kind);
    void operationCommitted(const TabDrop::DragOperation& operation);

private:
    void applyIndicatorSettings(DropTargetAdapter* target) const;
    void onFeedbackRequested(FeedbackKind kind);

    QPointer<IDragSettings> m_settings;
    std::unique_ptr<GuiWindowProvider> m_ownedWindowProvider;
    IWindowProvider* m_windowProvider;

    DragLock* m_lock;
    DropZoneRegistry* m_registry;
    DragSession* m_session;
    CommitEmitter* m_emitter;
    CrossWindowCoordinator* m_coordinator;
    PointerGestureMonitor* m_monitor;

    bool m_feedbackEnabled = true;
};

} // namespace TabDrop
