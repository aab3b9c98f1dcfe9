// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tabordermodel.h"
#include "../core/logging.h"

#include <algorithm>

namespace TabDrop {

TabOrderModel::TabOrderModel(QObject* parent)
    : QObject(parent)
{
}

void TabOrderModel::setTabs(const Container& container, const QList<QUuid>& tabs)
{
    m_tabs.insert(container, tabs);
    Q_EMIT containerChanged(container);
}

std::optional<std::pair<Container, int>> TabOrderModel::locate(const QUuid& tabId) const
{
    for (auto it = m_tabs.constBegin(); it != m_tabs.constEnd(); ++it) {
        const int index = it.value().indexOf(tabId);
        if (index >= 0) {
            return std::make_pair(it.key(), index);
        }
    }
    return std::nullopt;
}

void TabOrderModel::applyDragOperation(const DragOperation& operation)
{
    // The staged source index may be stale; trust the live position
    const auto location = locate(operation.tabId);
    if (!location) {
        qCWarning(lcModel) << "Ignoring" << operation << "- tab is not in any container";
        return;
    }

    const Container from = location->first;
    const int fromIndex = location->second;
    if (from != operation.fromContainer) {
        qCWarning(lcModel) << "Tab" << operation.tabId << "is in" << from << "not" << operation.fromContainer
                           << "- moving from its live position";
    }

    // Create the destination before taking references; inserting may rehash
    if (!m_tabs.contains(operation.toContainer)) {
        m_tabs.insert(operation.toContainer, QList<QUuid>());
    }
    QList<QUuid>& source = m_tabs[from];
    if (from == operation.toContainer) {
        const int toIndex = std::clamp(operation.toIndex, 0, int(source.size()) - 1);
        if (toIndex == fromIndex) {
            qCDebug(lcModel) << "No-op reorder of" << operation.tabId << "in" << from;
            return;
        }
        source.move(fromIndex, toIndex);
        qCInfo(lcModel) << "Reordered" << operation.tabId << "in" << from << ":" << fromIndex << "->" << toIndex;
        Q_EMIT tabMoved(operation.tabId, from, fromIndex, from, toIndex);
        Q_EMIT containerChanged(from);
        return;
    }

    QList<QUuid>& destination = m_tabs[operation.toContainer];
    const int toIndex = std::clamp(operation.toIndex, 0, int(destination.size()));
    source.removeAt(fromIndex);
    destination.insert(toIndex, operation.tabId);

    qCInfo(lcModel) << "Moved" << operation.tabId << "from" << from << "#" << fromIndex << "to"
                    << operation.toContainer << "#" << toIndex;
    Q_EMIT tabMoved(operation.tabId, from, fromIndex, operation.toContainer, toIndex);
    Q_EMIT containerChanged(from);
    Q_EMIT containerChanged(operation.toContainer);
}

} // namespace TabDrop
