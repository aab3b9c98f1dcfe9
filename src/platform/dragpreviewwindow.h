// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/types.h"
#include "tabdrop_export.h"
#include <QRasterWindow>
#include <QString>

namespace TabDrop {

/**
 * @brief Floating drag preview that belongs to no application window
 *
 * A frameless, input-transparent top-level surface positioned in screen
 * coordinates, so the drag visual survives the cursor crossing between
 * windows or leaving them altogether.
 */
class TABDROP_EXPORT DragPreviewWindow : public QRasterWindow
{
    Q_OBJECT

public:
    explicit DragPreviewWindow(QWindow* parent = nullptr);

    void setTabTitle(const QString& title);
    QString tabTitle() const { return m_tabTitle; }

    void setPreviewStyle(PreviewStyle style);
    PreviewStyle previewStyle() const { return m_style; }

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    QString m_tabTitle;
    PreviewStyle m_style = PreviewStyle::TabRow;
};

} // namespace TabDrop
