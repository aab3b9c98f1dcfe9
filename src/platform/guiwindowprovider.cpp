// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "guiwindowprovider.h"

#include <QGuiApplication>

namespace TabDrop {

QVector<WindowInfo> GuiWindowProvider::visibleWindows() const
{
    QVector<WindowInfo> windows;

    auto accept = [this](const QWindow* window) {
        return window && window->isVisible() && window != m_excluded.data()
            && !window->flags().testFlag(Qt::WindowTransparentForInput);
    };

    // Qt exposes no stacking order; the focus window is the best guess for frontmost
    QWindow* focus = QGuiApplication::focusWindow();
    if (focus && !focus->isTopLevel()) {
        focus = nullptr;
    }
    if (accept(focus)) {
        windows.append(WindowInfo{windowKey(focus), QRectF(focus->geometry())});
    }

    const QWindowList topLevels = QGuiApplication::topLevelWindows();
    for (const QWindow* window : topLevels) {
        if (window != focus && accept(window)) {
            windows.append(WindowInfo{windowKey(window), QRectF(window->geometry())});
        }
    }
    return windows;
}

} // namespace TabDrop
