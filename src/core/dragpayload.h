// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabdrop_export.h"
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QUuid>

#include <memory>
#include <optional>

class QMimeData;

namespace TabDrop {

/**
 * @brief Immutable identity of a dragged tab
 *
 * Used as in-process drag state and, on the native path, serialized onto the
 * drag pasteboard. The typed encoding is versioned JSON under
 * MimeType::TabItem; the bare tab id is also written as plain text.
 */
class TABDROP_EXPORT DragPayload
{
public:
    DragPayload() = default;
    DragPayload(const QUuid& tabId, const QString& title, const QString& urlString = QString());

    QUuid tabId() const
    {
        return m_tabId;
    }
    QString title() const
    {
        return m_title;
    }
    QString urlString() const
    {
        return m_urlString;
    }

    bool isValid() const
    {
        return !m_tabId.isNull();
    }

    QJsonObject toJson() const;

    /**
     * @brief Decode a payload written by toJson()
     * @return nullopt if the tab id is missing or the version is newer than this build understands
     */
    static std::optional<DragPayload> fromJson(const QJsonObject& json);

    std::unique_ptr<QMimeData> toMimeData() const;

    /**
     * @brief Decode a pasteboard item
     *
     * Prefers the typed payload. Falls back to a plain-text UUID, in which case
     * title and URL are empty.
     */
    static std::optional<DragPayload> fromMimeData(const QMimeData* mimeData);

    bool operator==(const DragPayload& other) const
    {
        return m_tabId == other.m_tabId && m_title == other.m_title && m_urlString == other.m_urlString;
    }
    bool operator!=(const DragPayload& other) const
    {
        return !(*this == other);
    }

private:
    QUuid m_tabId;
    QString m_title;
    QString m_urlString;
};

} // namespace TabDrop

Q_DECLARE_METATYPE(TabDrop::DragPayload)
