// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "container.h"
#include "dragoperation.h"
#include "dragpayload.h"
#include "tabdrop_export.h"
#include "types.h"
#include "windowlocator.h"
#include <QHash>
#include <QObject>
#include <QPointF>

#include <optional>

namespace TabDrop {

class DropZoneRegistry;
class IWindowProvider;

/**
 * @brief State of the one in-progress drag
 *
 * The only writable copy of the drag state. Adapters mutate it through the
 * methods below and read it through the getters; nothing else keeps a second
 * copy.
 *
 * Lifecycle: Idle -> Dragging -> {Committing | Cancelled} -> Idle.
 * Every mutator is a no-op while Idle. Pointer events routinely arrive after
 * a drag has ended (a trailing move after release), so "no session" is an
 * inert state rather than an error.
 */
class TABDROP_EXPORT DragSession : public QObject
{
    Q_OBJECT
    Q_PROPERTY(State state READ state NOTIFY stateChanged)
    Q_PROPERTY(bool dragging READ isDragging NOTIFY stateChanged)
    Q_PROPERTY(bool outsideWindow READ isOutsideWindow NOTIFY outsideWindowChanged)

public:
    enum class State {
        Idle,
        Dragging,
        Committing,
        Cancelled
    };
    Q_ENUM(State)

    explicit DragSession(DropZoneRegistry* registry, QObject* parent = nullptr);

    /// Window enumeration for updateCursor(). Without one the cursor is always inside window 0.
    void setWindowProvider(IWindowProvider* provider) { m_windowProvider = provider; }
    void setWindowEdgeHysteresis(qreal margin) { m_locator.setMargin(margin); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Mutators
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Open a session
     * @return false if a session is already open (nothing changes)
     */
    bool beginDrag(const DragPayload& payload, const Container& sourceZone, int sourceIndex);

    /**
     * @brief Move the cursor to @p screenPoint
     *
     * Resolves the containing window with edge hysteresis. Leaving every window
     * clears the active zone; crossing in either direction emits
     * FeedbackKind::WindowBoundaryCrossed.
     */
    void updateCursor(const QPointF& screenPoint);

    void enterZone(const Container& zone);
    void exitZone(const Container& zone);

    /**
     * @brief Resolve the insertion index under @p localPoint
     * @param localPoint Zone-local point
     * @param isGrid Use grid boundaries; ignored unless the zone has a column count
     * @return The stored index for @p zone, nullopt while idle or for a non-finite point
     *
     * Clamped to [0, count] for a foreign zone and [0, count - 1] for the
     * source zone. Signals fire only when the index actually changes.
     */
    std::optional<int> updateInsertionIndex(const Container& zone, const QPointF& localPoint, bool isGrid);

    /**
     * @brief Release over @p targetZone
     *
     * Stages a move only when @p targetZone differs from the source zone.
     * The session is closed either way.
     */
    std::optional<PendingMove> completeDrop(const Container& targetZone, int targetIndex);

    /**
     * @brief Release over the source zone
     *
     * Stages a reorder only when the source zone's insertion index differs
     * from the source index. The session is closed either way.
     */
    std::optional<PendingMove> completeReorder();

    /// Close the session without staging anything. Safe while idle.
    void cancelDrag();

    // ═══════════════════════════════════════════════════════════════════════════
    // State queries
    // ═══════════════════════════════════════════════════════════════════════════

    State state() const { return m_state; }
    bool isDragging() const { return m_state == State::Dragging; }

    DragPayload payload() const { return m_payload; }
    Container sourceZone() const { return m_sourceZone; }
    int sourceIndex() const { return m_sourceIndex; }
    std::optional<Container> activeZone() const { return m_activeZone; }
    std::optional<int> insertionIndex(const Container& zone) const;

    QPointF localCursor() const { return m_localCursor; }
    QPointF screenCursor() const { return m_screenCursor; }
    WindowKey currentWindow() const { return m_currentWindow; }
    bool isOutsideWindow() const { return m_outsideWindow; }

    /// Dragging within the list it came from. The essentials grid never counts.
    bool isSameZoneReorder() const;

    /**
     * @brief Live-reorder displacement for the item at @p index
     *
     * While reordering inside the source zone, items between the source and
     * insertion index shift by one cell step toward the vacated slot.
     */
    qreal reorderOffset(const Container& zone, int index) const;

Q_SIGNALS:
    void dragStarted(const TabDrop::DragPayload& payload, const TabDrop::Container& sourceZone, int sourceIndex);
    void dragEnded(bool cancelled);
    void dragCancelled();
    void stateChanged(TabDrop::DragSession::State state);
    void activeZoneChanged();
    void insertionIndexChanged(const TabDrop::Container& zone, int index);
    void outsideWindowChanged(bool outside);
    void cursorMoved(const QPointF& screenPoint);
    void feedbackRequested(TabDrop::FeedbackKind kind);

private:
    void setState(State state);
    void setActiveZone(const std::optional<Container>& zone);
    void clear();

    DropZoneRegistry* m_registry;
    IWindowProvider* m_windowProvider = nullptr;
    WindowLocator m_locator;

    State m_state = State::Idle;
    DragPayload m_payload;
    Container m_sourceZone;
    int m_sourceIndex = -1;
    std::optional<Container> m_activeZone;
    QHash<Container, int> m_insertionIndex;

    QPointF m_localCursor;
    QPointF m_screenCursor;
    WindowKey m_currentWindow = 0;
    bool m_outsideWindow = false;
    quint64 m_commitSequence = 0;
};

} // namespace TabDrop
