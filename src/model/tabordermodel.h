// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/container.h"
#include "../core/interfaces.h"
#include "tabdrop_export.h"
#include <QHash>
#include <QList>
#include <QObject>
#include <QUuid>

#include <optional>
#include <utility>

namespace TabDrop {

/**
 * @brief In-memory tab owner: container -> ordered tab ids
 *
 * Applies a DragOperation as one move. Observers see a single tabMoved()
 * after the tab has left its source and landed in its destination, never an
 * intermediate state with the tab in neither or both.
 */
class TABDROP_EXPORT TabOrderModel : public QObject, public ITabOwner
{
    Q_OBJECT

public:
    explicit TabOrderModel(QObject* parent = nullptr);

    void setTabs(const Container& container, const QList<QUuid>& tabs);
    QList<QUuid> tabs(const Container& container) const { return m_tabs.value(container); }
    QList<Container> containers() const { return m_tabs.keys(); }

    /// Container and index currently holding @p tabId
    std::optional<std::pair<Container, int>> locate(const QUuid& tabId) const;

    void applyDragOperation(const DragOperation& operation) override;

Q_SIGNALS:
    void tabMoved(const QUuid& tabId, const TabDrop::Container& from, int fromIndex, const TabDrop::Container& to,
                  int toIndex);
    void containerChanged(const TabDrop::Container& container);

private:
    QHash<Container, QList<QUuid>> m_tabs;
};

} // namespace TabDrop
