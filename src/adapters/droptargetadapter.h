// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/constants.h"
#include "../core/container.h"
#include "tabdrop_export.h"
#include <QObject>
#include <QPointF>
#include <QPointer>
#include <QRectF>

#include <functional>
#include <optional>

namespace TabDrop {

class CommitEmitter;
class DragSession;
class DropZoneRegistry;

/**
 * @brief Drop handling for one registered zone
 *
 * Fed zone-local pointer positions (by CrossWindowCoordinator or directly by
 * the host's drop callbacks). Resolves the insertion index through the
 * session, publishes the insertion indicator and on drop hands the staged
 * commit to the CommitEmitter.
 *
 * Events are ignored unless the session is dragging, the point is finite and
 * the resolved index is non-negative. Late deliveries after a drag has ended
 * are common and harmless.
 */
class TABDROP_EXPORT DropTargetAdapter : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool highlighted READ isHighlighted NOTIFY highlightedChanged)

public:
    /// Indicator frame for an empty zone, in zone-local coordinates
    using FallbackFrameProvider = std::function<QRectF()>;
    /// Zone-local rectangle to overlay coordinates
    using OverlayMapper = std::function<QRectF(const QRectF&)>;

    DropTargetAdapter(const Container& zone, DragSession* session, DropZoneRegistry* registry,
                      CommitEmitter* emitter, QObject* parent = nullptr);

    Container zone() const { return m_zone; }

    void setFallbackFrameProvider(FallbackFrameProvider provider) { m_fallbackFrame = std::move(provider); }
    void setOverlayMapper(OverlayMapper mapper) { m_overlayMapper = std::move(mapper); }

    void setIndicatorThickness(qreal thickness) { m_indicatorThickness = thickness; }
    void setIndicatorInset(qreal inset) { m_indicatorInset = inset; }
    void setEmptyZoneIndicatorFraction(qreal fraction) { m_emptyFraction = fraction; }

    void pointerEntered(const QPointF& localPoint);
    void pointerMoved(const QPointF& localPoint);
    void pointerExited();

    /**
     * @brief Release inside the zone
     * @return true if the drop was taken (the session was dragging), whether or not a move was staged
     */
    bool drop(const QPointF& localPoint);

    bool isHighlighted() const { return m_highlighted; }
    std::optional<QRectF> indicatorFrame() const { return m_indicatorFrame; }

Q_SIGNALS:
    void indicatorFrameChanged(const QRectF& frame);
    void indicatorCleared();
    void highlightedChanged(bool highlighted);
    void dropped(bool committed);

private:
    bool acceptsUpdate(const QPointF& localPoint) const;
    void updateTarget(const QPointF& localPoint);
    QRectF computeIndicatorFrame(int index) const;
    void setHighlighted(bool highlighted);
    void clearLocalState();

    Container m_zone;
    QPointer<DragSession> m_session;
    QPointer<DropZoneRegistry> m_registry;
    QPointer<CommitEmitter> m_emitter;

    FallbackFrameProvider m_fallbackFrame;
    OverlayMapper m_overlayMapper;

    qreal m_indicatorThickness = Defaults::IndicatorThickness;
    qreal m_indicatorInset = Defaults::IndicatorInset;
    qreal m_emptyFraction = Defaults::EmptyZoneIndicatorFraction;

    bool m_highlighted = false;
    std::optional<QRectF> m_indicatorFrame;
};

} // namespace TabDrop
