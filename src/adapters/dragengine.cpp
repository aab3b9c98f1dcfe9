// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dragengine.h"
#include "crosswindowcoordinator.h"
#include "dragsourceadapter.h"
#include "droptargetadapter.h"
#include "pointergesturemonitor.h"
#include "../core/commitemitter.h"
#include "../core/draglock.h"
#include "../core/dragsession.h"
#include "../core/dropzoneregistry.h"
#include "../core/interfaces.h"
#include "../core/logging.h"
#include "../platform/dragpreviewwindow.h"
#include "../platform/guiwindowprovider.h"

#include <QSize>

namespace TabDrop {

DragEngine::DragEngine(IDragSettings* settings, IWindowProvider* windowProvider, ITabOwner* tabOwner,
                       QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_windowProvider(windowProvider)
{
    if (!m_windowProvider) {
        m_ownedWindowProvider = std::make_unique<GuiWindowProvider>();
        m_windowProvider = m_ownedWindowProvider.get();
    }

    m_lock = new DragLock(this);
    m_registry = new DropZoneRegistry(this);
    m_session = new DragSession(m_registry, this);
    m_session->setWindowProvider(m_windowProvider);
    m_emitter = new CommitEmitter(tabOwner, this);
    m_coordinator = new CrossWindowCoordinator(m_session, m_registry, this);
    m_monitor = new PointerGestureMonitor(m_coordinator, m_session, this);

    // Keep the preview surface out of window hit testing
    if (m_ownedWindowProvider) {
        connect(m_coordinator, &CrossWindowCoordinator::previewWindowCreated, this,
                [this](DragPreviewWindow* window) {
                    m_ownedWindowProvider->setExcludedWindow(window);
                });
    }

    connect(m_session, &DragSession::feedbackRequested, this, &DragEngine::onFeedbackRequested);
    connect(m_coordinator, &CrossWindowCoordinator::feedbackRequested, this, &DragEngine::onFeedbackRequested);
    connect(m_emitter, &CommitEmitter::operationCommitted, this, &DragEngine::operationCommitted);

    if (m_settings) {
        connect(m_settings, &IDragSettings::settingsChanged, this, &DragEngine::applySettings);
    }
    applySettings();
}

DragEngine::~DragEngine()
{
    // Sources and targets owned elsewhere may outlive us; end the drag while the session exists
    m_session->cancelDrag();
}

void DragEngine::applySettings()
{
    if (!m_settings) {
        return;
    }

    m_monitor->setThreshold(m_settings->dragThreshold());
    m_session->setWindowEdgeHysteresis(m_settings->windowEdgeHysteresis());
    m_registry->setDefaultCellSize(m_settings->cellSize());
    m_registry->setDefaultSpacing(m_settings->cellSpacing());
    m_coordinator->setPreviewSize(QSize(m_settings->previewWidth(), m_settings->previewHeight()));
    m_coordinator->setCenterPreviewInSidebar(m_settings->centerPreviewInSidebar());
    m_coordinator->setPreviewWindowEnabled(m_settings->previewWindowEnabled());
    m_feedbackEnabled = m_settings->feedbackEnabled();

    const QList<DropTargetAdapter*> targets = m_coordinator->targets();
    for (DropTargetAdapter* target : targets) {
        applyIndicatorSettings(target);
    }

    qCDebug(lcCore) << "Applied settings: threshold" << m_settings->dragThreshold() << "feedback"
                    << m_feedbackEnabled;
}

void DragEngine::applyIndicatorSettings(DropTargetAdapter* target) const
{
    if (!m_settings || !target) {
        return;
    }
    target->setIndicatorThickness(m_settings->indicatorThickness());
    target->setIndicatorInset(m_settings->indicatorInset());
    target->setEmptyZoneIndicatorFraction(m_settings->emptyZoneIndicatorFraction());
}

DragSourceAdapter* DragEngine::createDragSource(const DragPayload& payload, const Container& container, int index,
                                                QObject* parent)
{
    auto* source = new DragSourceAdapter(m_session, m_lock, parent);
    source->setPayload(payload);
    source->setLocation(container, index);
    source->setCoordinator(m_coordinator);
    m_monitor->registerSource(source);
    return source;
}

DropTargetAdapter* DragEngine::createDropTarget(const Container& zone, QObject* parent)
{
    auto* target = new DropTargetAdapter(zone, m_session, m_registry, m_emitter, parent);
    applyIndicatorSettings(target);
    m_coordinator->registerTarget(target);

    QPointer<CrossWindowCoordinator> coordinator = m_coordinator;
    connect(target, &QObject::destroyed, m_coordinator, [coordinator, target]() {
        if (coordinator) {
            coordinator->unregisterTarget(target);
        }
    });
    return target;
}

void DragEngine::onFeedbackRequested(FeedbackKind kind)
{
    if (m_feedbackEnabled) {
        Q_EMIT feedback(kind);
    }
}

} // namespace TabDrop
