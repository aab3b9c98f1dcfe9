// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "constants.h"
#include "tabdrop_export.h"
#include "types.h"
#include <QPointF>
#include <QVector>

namespace TabDrop {

/**
 * @brief Result of a screen-to-window hit test
 */
struct WindowHit
{
    WindowKey key = 0;
    QPointF localPoint; ///< Window-local point, or the screen point when outside
    bool inside = false;
};

/**
 * @brief Screen-to-window hit test with edge hysteresis
 *
 * Remembers the last answer. Leaving the current window requires the point
 * to be outside its frame grown by the margin; entering another window
 * requires the point to be inside its frame shrunk by the margin. A point in
 * the band between the two keeps the previous answer, so the cursor riding a
 * window edge doesn't flicker between inside and outside.
 *
 * A window in front of the current one takes over as soon as the point is
 * clearly inside it.
 */
class TABDROP_EXPORT WindowLocator
{
public:
    explicit WindowLocator(qreal margin = Defaults::WindowEdgeHysteresis);

    /**
     * @brief Locate @p screenPoint among @p windows
     * @param windows Visible windows, front-to-back
     */
    WindowHit locate(const QPointF& screenPoint, const QVector<WindowInfo>& windows);

    WindowHit current() const
    {
        return m_current;
    }

    qreal margin() const
    {
        return m_margin;
    }
    void setMargin(qreal margin);

    /// Forget the previous answer; the next locate() starts from "outside"
    void reset();

private:
    WindowHit m_current;
    qreal m_margin;
};

} // namespace TabDrop
