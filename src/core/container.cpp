// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "container.h"

namespace TabDrop {

Container Container::essentials()
{
    return Container(Kind::Essentials, QUuid());
}

Container Container::spacePinned(const QUuid& spaceId)
{
    return Container(Kind::SpacePinned, spaceId);
}

Container Container::spaceRegular(const QUuid& spaceId)
{
    return Container(Kind::SpaceRegular, spaceId);
}

Container Container::folder(const QUuid& folderId)
{
    return Container(Kind::Folder, folderId);
}

QUuid Container::groupingId() const
{
    return isSpace() ? m_id : QUuid();
}

QString Container::toString() const
{
    switch (m_kind) {
    case Kind::Essentials:
        return QStringLiteral("Essentials");
    case Kind::SpacePinned:
        return QStringLiteral("SpacePinned(%1)").arg(m_id.toString(QUuid::WithoutBraces));
    case Kind::SpaceRegular:
        return QStringLiteral("SpaceRegular(%1)").arg(m_id.toString(QUuid::WithoutBraces));
    case Kind::Folder:
        return QStringLiteral("Folder(%1)").arg(m_id.toString(QUuid::WithoutBraces));
    }
    return QString();
}

size_t qHash(const Container& container, size_t seed) noexcept
{
    return qHashMulti(seed, static_cast<int>(container.kind()), container.id());
}

QDebug operator<<(QDebug debug, const Container& container)
{
    QDebugStateSaver saver(debug);
    debug.noquote() << container.toString();
    return debug;
}

} // namespace TabDrop
