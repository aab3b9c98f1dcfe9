// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QJsonDocument>
#include <QJsonObject>
#include <QMimeData>
#include <QTest>

#include "core/constants.h"
#include "core/dragpayload.h"

using namespace TabDrop;

/**
 * @brief Unit tests for DragPayload serialization
 *
 * Tests cover:
 * - Typed MIME encoding carries the tab id, title and URL
 * - Plain-text UUID fallback for foreign drag sources
 * - Rejection of newer versions, malformed JSON and missing ids
 */
class TestDragPayload : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void test_toMimeData_typedAndPlainText()
    {
        const QUuid id = QUuid::createUuid();
        const DragPayload payload(id, QStringLiteral("Docs"), QStringLiteral("https://example.org/docs"));

        const std::unique_ptr<QMimeData> mime = payload.toMimeData();
        QVERIFY(mime);
        QVERIFY(mime->hasFormat(MimeType::TabItem));
        QCOMPARE(mime->text(), id.toString(QUuid::WithoutBraces));

        const std::optional<DragPayload> decoded = DragPayload::fromMimeData(mime.get());
        QVERIFY(decoded.has_value());
        QCOMPARE(*decoded, payload);
    }

    void test_fromMimeData_plainTextFallback()
    {
        const QUuid id = QUuid::createUuid();
        QMimeData mime;
        mime.setText(QStringLiteral("  %1\n").arg(id.toString(QUuid::WithoutBraces)));

        const std::optional<DragPayload> decoded = DragPayload::fromMimeData(&mime);
        QVERIFY(decoded.has_value());
        QCOMPARE(decoded->tabId(), id);
        QVERIFY(decoded->title().isEmpty());
        QVERIFY(decoded->urlString().isEmpty());
    }

    void test_fromMimeData_unrelatedText_rejected()
    {
        QMimeData mime;
        mime.setText(QStringLiteral("not a tab"));
        QVERIFY(!DragPayload::fromMimeData(&mime).has_value());
        QVERIFY(!DragPayload::fromMimeData(nullptr).has_value());
    }

    void test_fromMimeData_malformedTyped_noFallback()
    {
        QMimeData mime;
        mime.setData(MimeType::TabItem, QByteArrayLiteral("{not json"));
        mime.setText(QUuid::createUuid().toString(QUuid::WithoutBraces));
        QVERIFY(!DragPayload::fromMimeData(&mime).has_value());
    }

    void test_fromJson_newerVersion_rejected()
    {
        QJsonObject json = DragPayload(QUuid::createUuid(), QStringLiteral("Tab")).toJson();
        json[JsonKeys::Version] = PayloadVersion + 1;
        QVERIFY(!DragPayload::fromJson(json).has_value());
    }

    void test_fromJson_missingVersion_treatedAsCurrent()
    {
        const QUuid id = QUuid::createUuid();
        QJsonObject json;
        json[JsonKeys::TabId] = id.toString();
        json[JsonKeys::Title] = QStringLiteral("Legacy");

        const std::optional<DragPayload> decoded = DragPayload::fromJson(json);
        QVERIFY(decoded.has_value());
        QCOMPARE(decoded->tabId(), id);
        QCOMPARE(decoded->title(), QStringLiteral("Legacy"));
    }

    void test_fromJson_missingTabId_rejected()
    {
        QJsonObject json;
        json[JsonKeys::Version] = PayloadVersion;
        json[JsonKeys::Title] = QStringLiteral("Orphan");
        QVERIFY(!DragPayload::fromJson(json).has_value());
    }

    void test_toJson_omitsEmptyUrl()
    {
        const QJsonObject json = DragPayload(QUuid::createUuid(), QStringLiteral("Tab")).toJson();
        QVERIFY(!json.contains(JsonKeys::Url));
        QCOMPARE(json.value(JsonKeys::Version).toInt(), PayloadVersion);
    }
};

QTEST_MAIN(TestDragPayload)
#include "test_drag_payload.moc"
