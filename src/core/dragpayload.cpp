// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dragpayload.h"
#include "constants.h"
#include "logging.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QMimeData>

namespace TabDrop {

DragPayload::DragPayload(const QUuid& tabId, const QString& title, const QString& urlString)
    : m_tabId(tabId)
    , m_title(title)
    , m_urlString(urlString)
{
}

QJsonObject DragPayload::toJson() const
{
    QJsonObject json;
    json[JsonKeys::Version] = PayloadVersion;
    json[JsonKeys::TabId] = m_tabId.toString(QUuid::WithoutBraces);
    json[JsonKeys::Title] = m_title;
    if (!m_urlString.isEmpty()) {
        json[JsonKeys::Url] = m_urlString;
    }
    return json;
}

std::optional<DragPayload> DragPayload::fromJson(const QJsonObject& json)
{
    const int version = json.value(JsonKeys::Version).toInt(PayloadVersion);
    if (version > PayloadVersion) {
        qCWarning(lcCore) << "Rejecting drag payload with unsupported version" << version;
        return std::nullopt;
    }

    const QUuid tabId = QUuid::fromString(json.value(JsonKeys::TabId).toString());
    if (tabId.isNull()) {
        qCWarning(lcCore) << "Rejecting drag payload without a valid tab id";
        return std::nullopt;
    }

    return DragPayload(tabId, json.value(JsonKeys::Title).toString(), json.value(JsonKeys::Url).toString());
}

std::unique_ptr<QMimeData> DragPayload::toMimeData() const
{
    auto mimeData = std::make_unique<QMimeData>();
    mimeData->setData(MimeType::TabItem, QJsonDocument(toJson()).toJson(QJsonDocument::Compact));
    mimeData->setText(m_tabId.toString(QUuid::WithoutBraces));
    return mimeData;
}

std::optional<DragPayload> DragPayload::fromMimeData(const QMimeData* mimeData)
{
    if (!mimeData) {
        return std::nullopt;
    }

    if (mimeData->hasFormat(MimeType::TabItem)) {
        QJsonParseError error;
        const QJsonDocument doc = QJsonDocument::fromJson(mimeData->data(MimeType::TabItem), &error);
        if (error.error != QJsonParseError::NoError || !doc.isObject()) {
            qCWarning(lcCore) << "Malformed tab drag payload:" << error.errorString();
            return std::nullopt;
        }
        return fromJson(doc.object());
    }

    if (mimeData->hasText()) {
        const QUuid tabId = QUuid::fromString(mimeData->text().trimmed());
        if (!tabId.isNull()) {
            return DragPayload(tabId, QString());
        }
    }

    return std::nullopt;
}

} // namespace TabDrop
