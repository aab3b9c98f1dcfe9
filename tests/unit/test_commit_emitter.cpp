// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QSignalSpy>
#include <QTest>
#include <QUuid>

#include "core/commitemitter.h"
#include "testhelpers.h"

using namespace TabDrop;
using namespace TabDrop::TestHelpers;

/**
 * @brief Unit tests for CommitEmitter
 *
 * Tests cover:
 * - PendingMove to DragOperation conversion, including the grouping id
 * - Exactly one applyDragOperation() per staged commit
 * - Missing tab owner
 */
class TestCommitEmitter : public QObject
{
    Q_OBJECT

private:
    static PendingMove makeMove(const Container& from, int fromIndex, const Container& to, int toIndex,
                                quint64 sequence)
    {
        PendingMove move;
        move.payload = DragPayload(QUuid::createUuid(), QStringLiteral("Tab"));
        move.sourceZone = from;
        move.sourceIndex = fromIndex;
        move.targetZone = to;
        move.targetIndex = toIndex;
        move.isReorder = from == to;
        move.sequence = sequence;
        return move;
    }

private Q_SLOTS:
    void initTestCase()
    {
        qRegisterMetaType<TabDrop::DragOperation>();
    }

    void test_makeDragOperation_spaceTargetCarriesGroupingId()
    {
        const QUuid space = QUuid::createUuid();
        const PendingMove move = makeMove(Container::essentials(), 0, Container::spacePinned(space), 0, 1);

        const DragOperation op = CommitEmitter::makeDragOperation(move);
        QCOMPARE(op.tabId, move.payload.tabId());
        QCOMPARE(op.fromContainer, Container::essentials());
        QCOMPARE(op.fromIndex, 0);
        QCOMPARE(op.toContainer, Container::spacePinned(space));
        QCOMPARE(op.toIndex, 0);
        QCOMPARE(op.toGroupingId, space);
        QVERIFY(op.isMovingBetweenContainers());
        QVERIFY(!op.isReordering());
    }

    void test_makeDragOperation_essentialsTargetHasNoGroupingId()
    {
        const PendingMove move =
            makeMove(Container::spaceRegular(QUuid::createUuid()), 3, Container::essentials(), 1, 1);
        QVERIFY(CommitEmitter::makeDragOperation(move).toGroupingId.isNull());
    }

    void test_emitCommit_callsOwnerOnce()
    {
        RecordingTabOwner owner;
        CommitEmitter emitter(&owner);
        QSignalSpy spy(&emitter, &CommitEmitter::operationCommitted);
        const Container list = Container::spaceRegular(QUuid::createUuid());
        const PendingMove move = makeMove(list, 0, list, 2, 7);

        QVERIFY(emitter.emitCommit(move));
        QVERIFY(!emitter.emitCommit(move));
        QCOMPARE(owner.operations.size(), 1);
        QCOMPARE(spy.count(), 1);
        QVERIFY(owner.operations.first().isReordering());
    }

    void test_emitCommit_olderSequenceRefused()
    {
        RecordingTabOwner owner;
        CommitEmitter emitter(&owner);
        const Container list = Container::spaceRegular(QUuid::createUuid());

        QVERIFY(emitter.emitCommit(makeMove(list, 0, list, 1, 5)));
        QVERIFY(!emitter.emitCommit(makeMove(list, 0, list, 1, 4)));
        QVERIFY(emitter.emitCommit(makeMove(list, 0, list, 1, 6)));
        QCOMPARE(owner.operations.size(), 2);
    }

    void test_emitCommit_noOwner()
    {
        CommitEmitter emitter(nullptr);
        QSignalSpy spy(&emitter, &CommitEmitter::operationCommitted);
        QVERIFY(!emitter.emitCommit(makeMove(Container::essentials(), 0, Container::folder(QUuid::createUuid()), 0, 1)));
        QCOMPARE(spy.count(), 0);

        // The refused commit is not burnt; a late owner still receives it
        RecordingTabOwner owner;
        emitter.setTabOwner(&owner);
        QVERIFY(emitter.emitCommit(makeMove(Container::essentials(), 0, Container::folder(QUuid::createUuid()), 0, 1)));
        QCOMPARE(owner.operations.size(), 1);
    }
};

QTEST_MAIN(TestCommitEmitter)
#include "test_commit_emitter.moc"
