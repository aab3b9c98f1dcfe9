// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/constants.h"
#include "../core/types.h"
#include "tabdrop_export.h"
#include <QList>
#include <QObject>
#include <QPointF>
#include <QPointer>

class QEvent;
class QMimeData;

namespace TabDrop {

class CrossWindowCoordinator;
class DragSession;
class DragSourceAdapter;

/**
 * @brief Pointer event as seen by the gesture monitor
 */
struct PointerEvent
{
    enum class Type {
        Press,
        Move,
        Release
    };

    Type type = Type::Move;
    WindowKey window = 0;
    QPointF windowPos;
    QPointF screenPos;
};

/**
 * @brief One application-wide pointer monitor shared by every drag source
 *
 * Installed as an event filter on the application while at least one source
 * is registered. A press inside a source's bounds arms it; moves below the
 * threshold pass through untouched so ordinary clicks keep working. Once the
 * threshold is crossed the source tries to start a gesture drag, and from then
 * on moves and the release are consumed and fed to the coordinator.
 *
 * Native drag events (QDragMoveEvent/QDropEvent) carrying a tab payload are
 * translated into the same coordinator calls once the pasteboard tab id
 * matches the session's, and Escape cancels a drag in
 * progress.
 */
class TABDROP_EXPORT PointerGestureMonitor : public QObject
{
    Q_OBJECT

public:
    PointerGestureMonitor(CrossWindowCoordinator* coordinator, DragSession* session, QObject* parent = nullptr);
    ~PointerGestureMonitor() override;

    void registerSource(DragSourceAdapter* source);
    void unregisterSource(DragSourceAdapter* source);
    int sourceCount() const { return m_sources.size(); }
    bool isInstalled() const { return m_installed; }

    int threshold() const { return m_threshold; }
    void setThreshold(int threshold);

    /**
     * @brief Process one pointer event
     * @return true if the event was consumed by a drag
     */
    bool handlePointerEvent(const PointerEvent& event);

    /// Whether the current press turned into a gesture drag
    bool isGestureActive() const { return m_gestureActive; }

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    void install();
    void uninstall();
    void resetPress();
    void pruneSources();
    /// Whether @p mimeData encodes the tab the current session is dragging
    bool carriesSessionTab(const QMimeData* mimeData) const;

    QPointer<CrossWindowCoordinator> m_coordinator;
    QPointer<DragSession> m_session;
    QList<QPointer<DragSourceAdapter>> m_sources;

    int m_threshold = Defaults::DragThreshold;
    bool m_installed = false;

    // Current press
    QPointer<DragSourceAdapter> m_armedSource;
    QPointF m_pressPos;
    WindowKey m_pressWindow = 0;
    bool m_gestureActive = false;
};

} // namespace TabDrop
