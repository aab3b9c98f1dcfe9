// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "draglock.h"
#include "logging.h"

namespace TabDrop {

DragLock::DragLock(QObject* parent)
    : QObject(parent)
{
}

bool DragLock::tryAcquire(const QString& ownerId)
{
    if (ownerId.isEmpty()) {
        qCWarning(lcLock) << "Refusing lock acquisition with an empty owner id";
        return false;
    }

    if (!m_owner.isEmpty()) {
        qCDebug(lcLock) << "Lock denied for" << ownerId << "- held by" << m_owner;
        return false;
    }

    m_owner = ownerId;
    m_heldTimer.start();
    qCInfo(lcLock) << "Lock acquired by" << ownerId;
    Q_EMIT lockChanged(true);
    return true;
}

void DragLock::release(const QString& ownerId)
{
    if (m_owner.isEmpty()) {
        qCDebug(lcLock) << "Release by" << ownerId << "ignored - lock is free";
        return;
    }

    if (m_owner != ownerId) {
        qCDebug(lcLock) << "Release by" << ownerId << "ignored - held by" << m_owner;
        return;
    }

    qCInfo(lcLock) << "Lock released by" << ownerId << "after" << m_heldTimer.elapsed() << "ms";
    m_owner.clear();
    m_heldTimer.invalidate();
    Q_EMIT lockChanged(false);
}

void DragLock::forceReleaseAll()
{
    if (m_owner.isEmpty()) {
        return;
    }

    qCWarning(lcLock) << "Force releasing lock held by" << m_owner;
    m_owner.clear();
    m_heldTimer.invalidate();
    Q_EMIT lockChanged(false);
}

qint64 DragLock::heldForMs() const
{
    return m_heldTimer.isValid() ? m_heldTimer.elapsed() : 0;
}

QString DragLock::debugInfo() const
{
    if (m_owner.isEmpty()) {
        return QStringLiteral("unlocked");
    }
    return QStringLiteral("locked by %1 for %2 ms").arg(m_owner).arg(heldForMs());
}

} // namespace TabDrop
