// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QSignalSpy>
#include <QTest>
#include <QUuid>

#include "model/tabordermodel.h"

using namespace TabDrop;

/**
 * @brief Unit tests for TabOrderModel
 *
 * Tests cover:
 * - Same-container reorder semantics (0 -> 2 on [A, B, C] gives [B, C, A])
 * - Cross-container moves into empty and populated containers
 * - Index clamping and stale source indices
 * - One tabMoved() per applied operation
 */
class TestTabOrderModel : public QObject
{
    Q_OBJECT

private:
    QUuid a = QUuid::createUuid();
    QUuid b = QUuid::createUuid();
    QUuid c = QUuid::createUuid();
    QUuid x = QUuid::createUuid();
    QUuid y = QUuid::createUuid();

    static DragOperation op(const QUuid& tab, const Container& from, int fromIndex, const Container& to, int toIndex)
    {
        DragOperation operation;
        operation.tabId = tab;
        operation.fromContainer = from;
        operation.fromIndex = fromIndex;
        operation.toContainer = to;
        operation.toIndex = toIndex;
        operation.toGroupingId = to.groupingId();
        return operation;
    }

private Q_SLOTS:
    void initTestCase()
    {
        qRegisterMetaType<TabDrop::Container>();
    }

    void test_reorder_firstToLast()
    {
        TabOrderModel model;
        const Container list = Container::spaceRegular(QUuid::createUuid());
        model.setTabs(list, {a, b, c});
        QSignalSpy moved(&model, &TabOrderModel::tabMoved);

        model.applyDragOperation(op(a, list, 0, list, 2));
        QCOMPARE(model.tabs(list), QList<QUuid>({b, c, a}));
        QCOMPARE(moved.count(), 1);
    }

    void test_reorder_lastToFirst()
    {
        TabOrderModel model;
        const Container list = Container::spaceRegular(QUuid::createUuid());
        model.setTabs(list, {a, b, c});

        model.applyDragOperation(op(c, list, 2, list, 0));
        QCOMPARE(model.tabs(list), QList<QUuid>({c, a, b}));
    }

    void test_reorder_sameIndex_noSignal()
    {
        TabOrderModel model;
        const Container list = Container::spaceRegular(QUuid::createUuid());
        model.setTabs(list, {a, b, c});
        QSignalSpy moved(&model, &TabOrderModel::tabMoved);

        model.applyDragOperation(op(b, list, 1, list, 1));
        QCOMPARE(model.tabs(list), QList<QUuid>({a, b, c}));
        QCOMPARE(moved.count(), 0);
    }

    void test_move_essentialsToEmptyPinned()
    {
        TabOrderModel model;
        const QUuid space = QUuid::createUuid();
        const Container pinned = Container::spacePinned(space);
        model.setTabs(Container::essentials(), {x, y});

        model.applyDragOperation(op(y, Container::essentials(), 1, pinned, 0));
        QCOMPARE(model.tabs(Container::essentials()), QList<QUuid>({x}));
        QCOMPARE(model.tabs(pinned), QList<QUuid>({y}));
        QCOMPARE(model.locate(y)->first, pinned);
    }

    void test_move_indexClampedToAppend()
    {
        TabOrderModel model;
        const Container from = Container::spaceRegular(QUuid::createUuid());
        const Container to = Container::folder(QUuid::createUuid());
        model.setTabs(from, {a});
        model.setTabs(to, {b, c});

        model.applyDragOperation(op(a, from, 0, to, 99));
        QCOMPARE(model.tabs(to), QList<QUuid>({b, c, a}));
        QVERIFY(model.tabs(from).isEmpty());
    }

    void test_move_staleSourceIndex_usesLivePosition()
    {
        TabOrderModel model;
        const Container from = Container::spaceRegular(QUuid::createUuid());
        const Container to = Container::essentials();
        model.setTabs(from, {a, b, c});

        model.applyDragOperation(op(c, from, 0, to, 0));
        QCOMPARE(model.tabs(from), QList<QUuid>({a, b}));
        QCOMPARE(model.tabs(to), QList<QUuid>({c}));
    }

    void test_unknownTab_ignored()
    {
        TabOrderModel model;
        const Container list = Container::spaceRegular(QUuid::createUuid());
        model.setTabs(list, {a});
        QSignalSpy moved(&model, &TabOrderModel::tabMoved);

        model.applyDragOperation(op(QUuid::createUuid(), list, 0, Container::essentials(), 0));
        QCOMPARE(moved.count(), 0);
        QCOMPARE(model.tabs(list), QList<QUuid>({a}));
    }

    void test_locate()
    {
        TabOrderModel model;
        const Container list = Container::spaceRegular(QUuid::createUuid());
        model.setTabs(list, {a, b});
        QCOMPARE(model.locate(b)->second, 1);
        QVERIFY(!model.locate(c).has_value());
    }
};

QTEST_MAIN(TestTabOrderModel)
#include "test_tab_order_model.moc"
