// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dragpreviewwindow.h"
#include "../core/constants.h"

#include <QGuiApplication>
#include <QPainter>
#include <QPainterPath>
#include <QPalette>
#include <QSurfaceFormat>

namespace TabDrop {

DragPreviewWindow::DragPreviewWindow(QWindow* parent)
    : QRasterWindow(parent)
{
    setFlags(Qt::ToolTip | Qt::FramelessWindowHint | Qt::WindowTransparentForInput | Qt::WindowDoesNotAcceptFocus
             | Qt::WindowStaysOnTopHint);

    QSurfaceFormat surfaceFormat = format();
    surfaceFormat.setAlphaBufferSize(8);
    setFormat(surfaceFormat);

    setOpacity(Defaults::PreviewOpacity);
}

void DragPreviewWindow::setTabTitle(const QString& title)
{
    if (m_tabTitle == title) {
        return;
    }
    m_tabTitle = title;
    update();
}

void DragPreviewWindow::setPreviewStyle(PreviewStyle style)
{
    if (m_style == style) {
        return;
    }
    m_style = style;
    setOpacity(style == PreviewStyle::Ghost ? Defaults::GhostPreviewOpacity : Defaults::PreviewOpacity);
    update();
}

void DragPreviewWindow::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event)

    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setCompositionMode(QPainter::CompositionMode_Source);
    painter.fillRect(QRect(QPoint(0, 0), size()), Qt::transparent);
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);

    const QPalette palette = QGuiApplication::palette();
    const QRectF bounds = QRectF(QPointF(0, 0), QSizeF(size())).adjusted(1, 1, -1, -1);

    QRectF body = bounds;
    if (m_style == PreviewStyle::PinnedTile) {
        // Square tile centred in the surface
        const qreal side = qMin(bounds.width(), bounds.height());
        body = QRectF(0, 0, side, side);
        body.moveCenter(bounds.center());
    }

    QPainterPath path;
    path.addRoundedRect(body, Defaults::PreviewCornerRadius, Defaults::PreviewCornerRadius);
    painter.fillPath(path, palette.color(QPalette::Window));
    painter.setPen(QPen(palette.color(QPalette::Highlight), 1.5));
    painter.drawPath(path);

    if (m_tabTitle.isEmpty()) {
        return;
    }

    painter.setPen(palette.color(QPalette::WindowText));
    const QRectF textRect = body.adjusted(Defaults::PreviewCornerRadius, 0, -Defaults::PreviewCornerRadius, 0);
    const int alignment = m_style == PreviewStyle::PinnedTile ? Qt::AlignCenter : (Qt::AlignLeft | Qt::AlignVCenter);
    const QString elided = painter.fontMetrics().elidedText(m_tabTitle, Qt::ElideRight, int(textRect.width()));
    painter.drawText(textRect, alignment, elided);
}

} // namespace TabDrop
