// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pointergesturemonitor.h"
#include "crosswindowcoordinator.h"
#include "dragsourceadapter.h"
#include "../core/dragpayload.h"
#include "../core/dragsession.h"
#include "../core/logging.h"
#include "../platform/guiwindowprovider.h"

#include <QCoreApplication>
#include <QDropEvent>
#include <QKeyEvent>
#include <QLineF>
#include <QMimeData>
#include <QMouseEvent>
#include <QWindow>

#include <algorithm>

namespace TabDrop {

PointerGestureMonitor::PointerGestureMonitor(CrossWindowCoordinator* coordinator, DragSession* session,
                                             QObject* parent)
    : QObject(parent)
    , m_coordinator(coordinator)
    , m_session(session)
{
    if (m_session) {
        // Escape, a dropped target or a host cancel can end a gesture drag before the release
        connect(m_session, &DragSession::dragEnded, this, [this]() {
            if (!m_gestureActive) {
                return;
            }
            QPointer<DragSourceAdapter> source = m_armedSource;
            resetPress();
            qCDebug(lcSource) << "Session ended under an active gesture - disarming";
            if (source) {
                source->gestureEnded(false);
            }
        });
    }
}

PointerGestureMonitor::~PointerGestureMonitor()
{
    uninstall();
}

void PointerGestureMonitor::registerSource(DragSourceAdapter* source)
{
    if (!source) {
        return;
    }
    pruneSources();
    if (m_sources.contains(source)) {
        return;
    }
    m_sources.append(source);
    connect(source, &QObject::destroyed, this, [this]() {
        pruneSources();
    });
    install();
}

void PointerGestureMonitor::unregisterSource(DragSourceAdapter* source)
{
    m_sources.removeAll(source);
    if (m_armedSource == source) {
        resetPress();
    }
    pruneSources();
}

void PointerGestureMonitor::pruneSources()
{
    m_sources.removeIf([](const QPointer<DragSourceAdapter>& source) {
        return source.isNull();
    });
    if (m_sources.isEmpty()) {
        uninstall();
    }
}

void PointerGestureMonitor::setThreshold(int threshold)
{
    m_threshold = std::max(1, threshold);
}

void PointerGestureMonitor::install()
{
    if (m_installed) {
        return;
    }
    if (QCoreApplication* app = QCoreApplication::instance()) {
        app->installEventFilter(this);
        m_installed = true;
        qCDebug(lcSource) << "Pointer monitor installed";
    }
}

void PointerGestureMonitor::uninstall()
{
    if (!m_installed) {
        return;
    }
    if (QCoreApplication* app = QCoreApplication::instance()) {
        app->removeEventFilter(this);
    }
    m_installed = false;
    resetPress();
    qCDebug(lcSource) << "Pointer monitor removed";
}

void PointerGestureMonitor::resetPress()
{
    m_armedSource.clear();
    m_pressPos = QPointF();
    m_pressWindow = 0;
    m_gestureActive = false;
}

bool PointerGestureMonitor::carriesSessionTab(const QMimeData* mimeData) const
{
    if (!mimeData || !mimeData->hasFormat(MimeType::TabItem)) {
        return false;
    }
    if (!m_session || !m_session->isDragging() || !m_coordinator) {
        return false;
    }
    const std::optional<DragPayload> payload = DragPayload::fromMimeData(mimeData);
    if (!payload || payload->tabId() != m_session->payload().tabId()) {
        qCDebug(lcSource) << "Ignoring native drag event for a tab outside the current session";
        return false;
    }
    return true;
}

bool PointerGestureMonitor::handlePointerEvent(const PointerEvent& event)
{
    // A native drag owns the pointer; stay out of its way
    if (!m_gestureActive && m_session && m_session->isDragging()) {
        return false;
    }

    switch (event.type) {
    case PointerEvent::Type::Press:
        resetPress();
        for (const QPointer<DragSourceAdapter>& source : std::as_const(m_sources)) {
            if (source && source->hitTest(event.window, event.windowPos)) {
                m_armedSource = source;
                m_pressPos = event.windowPos;
                m_pressWindow = event.window;
                break;
            }
        }
        // Presses always pass through so buttons and selection still work
        return false;

    case PointerEvent::Type::Move: {
        if (m_gestureActive) {
            if (m_coordinator) {
                m_coordinator->updateScreenPosition(event.screenPos);
            }
            return true;
        }
        if (!m_armedSource || event.window != m_pressWindow) {
            return false;
        }

        const qreal distance = QLineF(m_pressPos, event.windowPos).length();
        if (distance < m_threshold) {
            return false;
        }

        if (!m_armedSource->startGestureDrag()) {
            // The native path won this press
            resetPress();
            return false;
        }

        m_gestureActive = true;
        if (m_coordinator) {
            m_coordinator->updateScreenPosition(event.screenPos);
        }
        return true;
    }

    case PointerEvent::Type::Release: {
        if (!m_gestureActive) {
            resetPress();
            return false;
        }

        QPointer<DragSourceAdapter> source = m_armedSource;
        resetPress();
        const bool accepted = m_coordinator ? m_coordinator->release(event.screenPos) : false;
        if (source) {
            source->gestureEnded(accepted);
        }
        return true;
    }
    }

    return false;
}

bool PointerGestureMonitor::eventFilter(QObject* watched, QEvent* event)
{
    // Widgets see their QWindow's events a second time; only handle the window's copy
    auto* window = qobject_cast<QWindow*>(watched);
    if (!window) {
        return QObject::eventFilter(watched, event);
    }

    switch (event->type()) {
    case QEvent::MouseButtonPress:
    case QEvent::MouseButtonRelease: {
        auto* mouse = static_cast<QMouseEvent*>(event);
        if (mouse->button() != Qt::LeftButton) {
            break;
        }
        PointerEvent pointer;
        pointer.type = event->type() == QEvent::MouseButtonPress ? PointerEvent::Type::Press
                                                                  : PointerEvent::Type::Release;
        pointer.window = GuiWindowProvider::windowKey(window);
        pointer.windowPos = mouse->position();
        pointer.screenPos = mouse->globalPosition();
        return handlePointerEvent(pointer);
    }
    case QEvent::MouseMove: {
        auto* mouse = static_cast<QMouseEvent*>(event);
        if (!(mouse->buttons() & Qt::LeftButton)) {
            break;
        }
        PointerEvent pointer;
        pointer.type = PointerEvent::Type::Move;
        pointer.window = GuiWindowProvider::windowKey(window);
        pointer.windowPos = mouse->position();
        pointer.screenPos = mouse->globalPosition();
        return handlePointerEvent(pointer);
    }
    case QEvent::DragEnter:
    case QEvent::DragMove: {
        auto* drag = static_cast<QDragMoveEvent*>(event);
        if (carriesSessionTab(drag->mimeData())) {
            m_coordinator->updateScreenPosition(window->mapToGlobal(drag->position()));
            drag->acceptProposedAction();
        }
        break;
    }
    case QEvent::Drop: {
        auto* drop = static_cast<QDropEvent*>(event);
        if (carriesSessionTab(drop->mimeData())) {
            const bool accepted = m_coordinator->release(window->mapToGlobal(drop->position()));
            if (accepted) {
                drop->acceptProposedAction();
            } else {
                drop->ignore();
            }
            return true;
        }
        break;
    }
    case QEvent::KeyPress: {
        auto* key = static_cast<QKeyEvent*>(event);
        if (key->key() == Qt::Key_Escape && m_session && m_session->isDragging() && m_coordinator) {
            qCInfo(lcSource) << "Escape pressed - cancelling drag";
            m_coordinator->cancel();
            return true;
        }
        break;
    }
    default:
        break;
    }

    return QObject::eventFilter(watched, event);
}

} // namespace TabDrop
