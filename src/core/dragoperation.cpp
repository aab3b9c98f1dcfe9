// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dragoperation.h"

namespace TabDrop {

QDebug operator<<(QDebug debug, const DragOperation& op)
{
    QDebugStateSaver saver(debug);
    debug.nospace().noquote() << "DragOperation(" << op.tabId.toString(QUuid::WithoutBraces) << " from "
                              << op.fromContainer.toString() << '#' << op.fromIndex << " to "
                              << op.toContainer.toString() << '#' << op.toIndex;
    if (!op.toGroupingId.isNull()) {
        debug << " group " << op.toGroupingId.toString(QUuid::WithoutBraces);
    }
    debug << ')';
    return debug;
}

} // namespace TabDrop
