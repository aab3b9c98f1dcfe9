// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QSignalSpy>
#include <QTest>
#include <QUuid>

#include <limits>

#include "adapters/droptargetadapter.h"
#include "core/commitemitter.h"
#include "core/dragsession.h"
#include "core/dropzoneregistry.h"
#include "testhelpers.h"

using namespace TabDrop;
using namespace TabDrop::TestHelpers;

/**
 * @brief Unit tests for DropTargetAdapter
 *
 * Tests cover:
 * - Highlight and indicator placement for list, grid and empty zones
 * - Fallback frame provider and overlay mapping
 * - Drop: cross-zone commit, same-zone reorder, release at the origin
 * - Local state cleared when the drag ends elsewhere
 */
class TestDropTarget : public QObject
{
    Q_OBJECT

private:
    struct Fixture
    {
        Fixture()
        {
            registry.registerZoneFrame(list, QRectF(0, 0, 200, 300));
            registry.registerZoneGeometry(list, 36.0, 2.0, 3);
            registry.registerZoneFrame(empty, QRectF(0, 0, 200, 60));
            registry.registerZoneGeometry(empty, 36.0, 2.0, 0);
            registry.registerZoneFrame(grid, QRectF(0, 0, 110, 200));
            registry.registerZoneGeometry(grid, 50.0, 10.0, 3, 2);
        }

        Container list = Container::spaceRegular(QUuid::createUuid());
        Container empty = Container::spacePinned(QUuid::createUuid());
        Container grid = Container::essentials();

        RecordingTabOwner owner;
        DropZoneRegistry registry;
        DragSession session{&registry};
        CommitEmitter emitter{&owner};
        DropTargetAdapter listTarget{list, &session, &registry, &emitter};
        DropTargetAdapter emptyTarget{empty, &session, &registry, &emitter};
        DropTargetAdapter gridTarget{grid, &session, &registry, &emitter};
    };

    static DragPayload payload()
    {
        return DragPayload(QUuid::createUuid(), QStringLiteral("Tab"));
    }

private Q_SLOTS:
    void initTestCase()
    {
        qRegisterMetaType<TabDrop::Container>();
    }

    void test_idle_ignoresPointer()
    {
        Fixture f;
        f.listTarget.pointerEntered(QPointF(50, 50));
        QVERIFY(!f.listTarget.isHighlighted());
        QVERIFY(!f.listTarget.indicatorFrame().has_value());
        QVERIFY(!f.listTarget.drop(QPointF(50, 50)));
    }

    void test_listIndicator_atBoundary()
    {
        Fixture f;
        QVERIFY(f.session.beginDrag(payload(), f.empty, 0));
        QSignalSpy highlighted(&f.listTarget, &DropTargetAdapter::highlightedChanged);

        f.listTarget.pointerEntered(QPointF(50, 50));
        QVERIFY(f.listTarget.isHighlighted());
        QCOMPARE(highlighted.count(), 1);
        QCOMPARE(f.session.activeZone(), std::optional<Container>(f.list));
        QCOMPARE(f.listTarget.indicatorFrame(), std::optional<QRectF>(QRectF(10, 73.5, 180, 3)));
    }

    void test_gridIndicator_usesBoundaryStrip()
    {
        Fixture f;
        QVERIFY(f.session.beginDrag(payload(), f.list, 0));

        f.gridTarget.pointerEntered(QPointF(80, 85));
        QCOMPARE(f.session.insertionIndex(f.grid), std::optional<int>(3));
        QCOMPARE(f.gridTarget.indicatorFrame(), std::optional<QRectF>(QRectF(53.5, 60, 3, 50)));
    }

    void test_emptyZone_defaultIndicator()
    {
        Fixture f;
        QVERIFY(f.session.beginDrag(payload(), f.list, 0));

        f.emptyTarget.pointerEntered(QPointF(100, 20));
        QCOMPARE(f.session.insertionIndex(f.empty), std::optional<int>(0));
        QCOMPARE(f.emptyTarget.indicatorFrame(), std::optional<QRectF>(QRectF(10, 18.5, 180, 3)));
    }

    void test_emptyZone_fallbackFrameAndOverlay()
    {
        Fixture f;
        f.emptyTarget.setFallbackFrameProvider([]() {
            return QRectF(4, 8, 120, 2);
        });
        f.emptyTarget.setOverlayMapper([](const QRectF& rect) {
            return rect.translated(0, 100);
        });
        QSignalSpy changed(&f.emptyTarget, &DropTargetAdapter::indicatorFrameChanged);
        QVERIFY(f.session.beginDrag(payload(), f.list, 0));

        f.emptyTarget.pointerEntered(QPointF(100, 20));
        QCOMPARE(f.emptyTarget.indicatorFrame(), std::optional<QRectF>(QRectF(4, 108, 120, 2)));
        QCOMPARE(changed.count(), 1);

        // Same frame again does not re-emit
        f.emptyTarget.pointerMoved(QPointF(110, 30));
        QCOMPARE(changed.count(), 1);
    }

    void test_nonFinitePoint_rejected()
    {
        Fixture f;
        QVERIFY(f.session.beginDrag(payload(), f.empty, 0));
        const qreal nan = std::numeric_limits<qreal>::quiet_NaN();
        f.listTarget.pointerEntered(QPointF(nan, nan));
        QVERIFY(!f.listTarget.isHighlighted());
        QVERIFY(!f.session.insertionIndex(f.list).has_value());
    }

    void test_drop_crossZone_commitsOnce()
    {
        Fixture f;
        const DragPayload tab = payload();
        QVERIFY(f.session.beginDrag(tab, f.grid, 1));
        QSignalSpy dropped(&f.emptyTarget, &DropTargetAdapter::dropped);

        f.emptyTarget.pointerEntered(QPointF(100, 20));
        QVERIFY(f.emptyTarget.drop(QPointF(100, 20)));

        QCOMPARE(f.owner.operations.size(), 1);
        const DragOperation& op = f.owner.operations.first();
        QCOMPARE(op.tabId, tab.tabId());
        QCOMPARE(op.fromContainer, f.grid);
        QCOMPARE(op.fromIndex, 1);
        QCOMPARE(op.toContainer, f.empty);
        QCOMPARE(op.toIndex, 0);
        QCOMPARE(op.toGroupingId, f.empty.id());
        QCOMPARE(dropped.count(), 1);
        QCOMPARE(dropped.first().first().toBool(), true);
        QVERIFY(!f.session.isDragging());
        QVERIFY(!f.emptyTarget.isHighlighted());
    }

    void test_drop_withoutHover_usesReleasePoint()
    {
        Fixture f;
        QVERIFY(f.session.beginDrag(payload(), f.empty, 0));
        QVERIFY(f.listTarget.drop(QPointF(50, 5000)));
        QCOMPARE(f.owner.operations.size(), 1);
        QCOMPARE(f.owner.operations.first().toIndex, 3);
    }

    void test_drop_sameZoneReorder()
    {
        Fixture f;
        QVERIFY(f.session.beginDrag(payload(), f.list, 0));

        f.listTarget.pointerEntered(QPointF(50, 200));
        QVERIFY(f.listTarget.drop(QPointF(50, 200)));
        QCOMPARE(f.owner.operations.size(), 1);
        QCOMPARE(f.owner.operations.first().fromIndex, 0);
        QCOMPARE(f.owner.operations.first().toIndex, 2);
        QVERIFY(f.owner.operations.first().isReordering());
    }

    void test_drop_atOrigin_noCommit()
    {
        Fixture f;
        QVERIFY(f.session.beginDrag(payload(), f.list, 1));
        QSignalSpy dropped(&f.listTarget, &DropTargetAdapter::dropped);

        // Lower half of row 0 resolves to index 1, the origin
        QVERIFY(f.listTarget.drop(QPointF(50, 20)));
        QVERIFY(f.owner.operations.isEmpty());
        QCOMPARE(dropped.first().first().toBool(), false);
    }

    void test_pointerExited_clearsState()
    {
        Fixture f;
        QVERIFY(f.session.beginDrag(payload(), f.empty, 0));
        QSignalSpy cleared(&f.listTarget, &DropTargetAdapter::indicatorCleared);

        f.listTarget.pointerEntered(QPointF(50, 50));
        f.listTarget.pointerExited();
        QVERIFY(!f.listTarget.isHighlighted());
        QVERIFY(!f.listTarget.indicatorFrame().has_value());
        QVERIFY(!f.session.insertionIndex(f.list).has_value());
        QVERIFY(!f.session.activeZone().has_value());
        QCOMPARE(cleared.count(), 1);
    }

    void test_cancelElsewhere_clearsIndicator()
    {
        Fixture f;
        QVERIFY(f.session.beginDrag(payload(), f.empty, 0));
        QSignalSpy cleared(&f.listTarget, &DropTargetAdapter::indicatorCleared);

        f.listTarget.pointerEntered(QPointF(50, 50));
        f.session.cancelDrag();
        QCOMPARE(cleared.count(), 1);
        QVERIFY(!f.listTarget.isHighlighted());
        QVERIFY(f.owner.operations.isEmpty());
    }

    void test_pointerMoved_reentersAfterLeavingWindow()
    {
        Fixture f;
        QVERIFY(f.session.beginDrag(payload(), f.empty, 0));
        f.listTarget.pointerEntered(QPointF(50, 50));
        f.session.exitZone(f.list);
        QVERIFY(!f.session.activeZone().has_value());

        f.listTarget.pointerMoved(QPointF(50, 10));
        QCOMPARE(f.session.activeZone(), std::optional<Container>(f.list));
        QCOMPARE(f.session.insertionIndex(f.list), std::optional<int>(1));
    }
};

QTEST_MAIN(TestDropTarget)
#include "test_drop_target.moc"
