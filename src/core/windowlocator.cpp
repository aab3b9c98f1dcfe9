// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowlocator.h"
#include "logging.h"

#include <algorithm>
#include <cmath>

namespace TabDrop {

WindowLocator::WindowLocator(qreal margin)
    : m_margin(std::max(0.0, margin))
{
}

void WindowLocator::setMargin(qreal margin)
{
    m_margin = std::max(0.0, margin);
}

void WindowLocator::reset()
{
    m_current = WindowHit();
}

WindowHit WindowLocator::locate(const QPointF& screenPoint, const QVector<WindowInfo>& windows)
{
    if (!std::isfinite(screenPoint.x()) || !std::isfinite(screenPoint.y())) {
        qCWarning(lcWindows) << "Ignoring non-finite screen point" << screenPoint;
        return m_current;
    }

    // Frontmost window that clearly contains the point
    int candidate = -1;
    for (int i = 0; i < windows.size(); ++i) {
        const QRectF inner = windows[i].frame.adjusted(m_margin, m_margin, -m_margin, -m_margin);
        if (inner.isValid() && inner.contains(screenPoint)) {
            candidate = i;
            break;
        }
    }

    int current = -1;
    if (m_current.inside) {
        for (int i = 0; i < windows.size(); ++i) {
            if (windows[i].key == m_current.key) {
                current = i;
                break;
            }
        }
    }

    int chosen = candidate;
    if (current >= 0) {
        const QRectF outer = windows[current].frame.adjusted(-m_margin, -m_margin, m_margin, m_margin);
        const bool stillNear = outer.contains(screenPoint);
        if (stillNear && (candidate < 0 || candidate > current)) {
            chosen = current;
        }
    }

    WindowHit hit;
    if (chosen >= 0) {
        hit.key = windows[chosen].key;
        hit.localPoint = screenPoint - windows[chosen].frame.topLeft();
        hit.inside = true;
    } else {
        hit.localPoint = screenPoint;
    }

    if (hit.key != m_current.key || hit.inside != m_current.inside) {
        qCDebug(lcWindows) << "Cursor window changed from" << m_current.key << "to" << hit.key << "at" << screenPoint;
    }

    m_current = hit;
    return hit;
}

} // namespace TabDrop
