// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include "tabdrop_export.h"
#include <QPointer>
#include <QWindow>

namespace TabDrop {

/**
 * @brief IWindowProvider over the application's top-level QWindows
 *
 * Lists visible top-level windows, focus window first. Input-transparent
 * windows (tooltips, the drag preview) are skipped since the cursor can never
 * be "in" them.
 */
class TABDROP_EXPORT GuiWindowProvider : public IWindowProvider
{
public:
    GuiWindowProvider() = default;

    QVector<WindowInfo> visibleWindows() const override;

    /// Never report @p window, even if it accepts input
    void setExcludedWindow(QWindow* window) { m_excluded = window; }

    static WindowKey windowKey(const QWindow* window)
    {
        return reinterpret_cast<WindowKey>(window);
    }

private:
    QPointer<QWindow> m_excluded;
};

} // namespace TabDrop
