// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dragoperation.h"
#include "tabdrop_export.h"
#include <QObject>

namespace TabDrop {

class ITabOwner;

/**
 * @brief Hands a staged commit to the tab owner exactly once
 */
class TABDROP_EXPORT CommitEmitter : public QObject
{
    Q_OBJECT

public:
    explicit CommitEmitter(ITabOwner* owner, QObject* parent = nullptr);

    void setTabOwner(ITabOwner* owner) { m_owner = owner; }
    ITabOwner* tabOwner() const { return m_owner; }

    static DragOperation makeDragOperation(const PendingMove& move);

    /**
     * @brief Dispatch @p move to the tab owner
     * @return false if @p move was already emitted or there is no owner
     */
    bool emitCommit(const PendingMove& move);

Q_SIGNALS:
    void operationCommitted(const TabDrop::DragOperation& operation);

private:
    ITabOwner* m_owner;
    quint64 m_lastSequence = 0;
};

} // namespace TabDrop
