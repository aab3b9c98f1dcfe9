// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabdrop_export.h"
#include <QElapsedTimer>
#include <QObject>
#include <QString>

namespace TabDrop {

/**
 * @brief Single mutual-exclusion gate for drag initiation
 *
 * Both initiation paths (native drag and pointer gesture) may observe the
 * same physical press. Whichever calls tryAcquire() first owns the drag; the
 * other sees false and yields. Acquisition is a plain check-and-set on the
 * UI thread with nothing in between that could re-enter.
 *
 * Owner ids are opaque per-gesture tokens. release() by anyone but the
 * current owner is ignored so a stale release can't evict a newer owner.
 */
class TABDROP_EXPORT DragLock : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool held READ isHeld NOTIFY lockChanged)

public:
    explicit DragLock(QObject* parent = nullptr);

    bool tryAcquire(const QString& ownerId);
    void release(const QString& ownerId);

    /// Drop the lock regardless of owner. Recovery only.
    void forceReleaseAll();

    bool isHeld() const { return !m_owner.isEmpty(); }
    QString owner() const { return m_owner; }

    /// Milliseconds since the current owner acquired the lock, 0 when free
    qint64 heldForMs() const;

    QString debugInfo() const;

Q_SIGNALS:
    void lockChanged(bool held);

private:
    QString m_owner;
    QElapsedTimer m_heldTimer;
};

} // namespace TabDrop
