// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "commitemitter.h"
#include "interfaces.h"
#include "logging.h"

namespace TabDrop {

CommitEmitter::CommitEmitter(ITabOwner* owner, QObject* parent)
    : QObject(parent)
    , m_owner(owner)
{
}

DragOperation CommitEmitter::makeDragOperation(const PendingMove& move)
{
    DragOperation operation;
    operation.tabId = move.payload.tabId();
    operation.fromContainer = move.sourceZone;
    operation.fromIndex = move.sourceIndex;
    operation.toContainer = move.targetZone;
    operation.toIndex = move.targetIndex;
    operation.toGroupingId = move.targetZone.groupingId();
    return operation;
}

bool CommitEmitter::emitCommit(const PendingMove& move)
{
    if (move.sequence != 0 && move.sequence <= m_lastSequence) {
        qCWarning(lcCommit) << "Refusing to emit staged commit" << move.sequence << "twice";
        return false;
    }
    if (!m_owner) {
        qCWarning(lcCommit) << "No tab owner - dropping staged commit" << move.sequence;
        return false;
    }

    if (move.sequence != 0) {
        m_lastSequence = move.sequence;
    }

    const DragOperation operation = makeDragOperation(move);
    qCInfo(lcCommit) << "Committing" << operation;
    m_owner->applyDragOperation(operation);
    Q_EMIT operationCommitted(operation);
    return true;
}

} // namespace TabDrop
