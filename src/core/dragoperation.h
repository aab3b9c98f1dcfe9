// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "container.h"
#include "dragpayload.h"
#include "tabdrop_export.h"
#include <QDebug>
#include <QMetaType>
#include <QUuid>

namespace TabDrop {

/**
 * @brief The single commit instruction handed to the tab owner
 *
 * Describes one atomic move. The owner validates the indices against its own
 * live state; the engine never retries or verifies the result.
 */
struct TABDROP_EXPORT DragOperation
{
    QUuid tabId;
    Container fromContainer;
    int fromIndex = -1;
    Container toContainer;
    int toIndex = -1;
    QUuid toGroupingId; ///< Null when the destination has no grouping (Essentials, Folder)

    bool isMovingBetweenContainers() const
    {
        return fromContainer != toContainer;
    }

    bool isReordering() const
    {
        return fromContainer == toContainer && fromIndex != toIndex;
    }

    bool operator==(const DragOperation& other) const
    {
        return tabId == other.tabId && fromContainer == other.fromContainer && fromIndex == other.fromIndex
            && toContainer == other.toContainer && toIndex == other.toIndex && toGroupingId == other.toGroupingId;
    }
};

/**
 * @brief A commit staged by DragSession::completeDrop()/completeReorder()
 *
 * Produced at most once per drag; CommitEmitter turns it into a DragOperation.
 */
struct TABDROP_EXPORT PendingMove
{
    DragPayload payload;
    Container sourceZone;
    int sourceIndex = -1;
    Container targetZone;
    int targetIndex = -1;
    bool isReorder = false;
    quint64 sequence = 0; ///< Unique per staged commit, assigned by the session
};

TABDROP_EXPORT QDebug operator<<(QDebug debug, const DragOperation& op);

} // namespace TabDrop

Q_DECLARE_METATYPE(TabDrop::DragOperation)
