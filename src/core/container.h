// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabdrop_export.h"
#include <QDebug>
#include <QHashFunctions>
#include <QMetaType>
#include <QString>
#include <QUuid>

namespace TabDrop {

/**
 * @brief Identifies where a tab lives or may be dropped
 *
 * A tagged value: the kind plus an id payload. Essentials is global and
 * carries no id. Two containers are equal only if both kind and id match,
 * so SpacePinned(g1) and SpacePinned(g2) are different drop zones.
 */
class TABDROP_EXPORT Container
{
public:
    enum class Kind {
        Essentials = 0, ///< Global pinned grid, no grouping id
        SpacePinned = 1, ///< Pinned list of one space
        SpaceRegular = 2, ///< Regular list of one space
        Folder = 3 ///< Tab folder
    };

    Container() = default;

    static Container essentials();
    static Container spacePinned(const QUuid& spaceId);
    static Container spaceRegular(const QUuid& spaceId);
    static Container folder(const QUuid& folderId);

    Kind kind() const
    {
        return m_kind;
    }
    QUuid id() const
    {
        return m_id;
    }

    /**
     * @brief Grouping id carried into a DragOperation
     *
     * The owning space for the two space kinds, null for Essentials and Folder.
     */
    QUuid groupingId() const;

    bool isSpace() const
    {
        return m_kind == Kind::SpacePinned || m_kind == Kind::SpaceRegular;
    }

    QString toString() const;

    bool operator==(const Container& other) const
    {
        return m_kind == other.m_kind && m_id == other.m_id;
    }
    bool operator!=(const Container& other) const
    {
        return !(*this == other);
    }

private:
    Container(Kind kind, const QUuid& id)
        : m_kind(kind)
        , m_id(id)
    {
    }

    Kind m_kind = Kind::Essentials;
    QUuid m_id;
};

TABDROP_EXPORT size_t qHash(const Container& container, size_t seed = 0) noexcept;
TABDROP_EXPORT QDebug operator<<(QDebug debug, const Container& container);

} // namespace TabDrop

Q_DECLARE_METATYPE(TabDrop::Container)
