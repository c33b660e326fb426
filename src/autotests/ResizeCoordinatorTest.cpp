/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ResizeCoordinatorTest.h"

#include <QSignalSpy>
#include <QTest>

#include "../resize/LeadingEdgeTimer.h"
#include "../resize/ResizeCoordinator.h"
#include "TestDoubles.h"

using namespace Termweave;

void ResizeCoordinatorTest::testLeadingEdgeFiresImmediately()
{
    LeadingEdgeTimer timer(50);
    QSignalSpy fired(&timer, &LeadingEdgeTimer::fired);

    timer.trigger();

    QCOMPARE(fired.count(), 1);
    QVERIFY(timer.state() == LeadingEdgeTimer::State::Armed);
    QVERIFY(timer.lastInvokeTimestamp() >= 0);

    // Nothing pending: the window closes without a second fire
    QTRY_VERIFY_WITH_TIMEOUT(timer.state() == LeadingEdgeTimer::State::Idle, 1000);
    QCOMPARE(fired.count(), 1);
}

void ResizeCoordinatorTest::testBurstCoalescesIntoOneTrailingFire()
{
    LeadingEdgeTimer timer(100);
    QSignalSpy fired(&timer, &LeadingEdgeTimer::fired);

    timer.trigger();
    timer.trigger();
    timer.trigger();
    QCOMPARE(fired.count(), 1);
    QVERIFY(timer.hasPending());

    QTRY_COMPARE_WITH_TIMEOUT(fired.count(), 2, 1000);
    QVERIFY(timer.state() == LeadingEdgeTimer::State::Fired);
    QVERIFY(!timer.hasPending());

    QTRY_VERIFY_WITH_TIMEOUT(timer.state() == LeadingEdgeTimer::State::Idle, 1000);
    QCOMPARE(fired.count(), 2);
}

void ResizeCoordinatorTest::testCancelDropsTrailingFire()
{
    LeadingEdgeTimer timer(50);
    QSignalSpy fired(&timer, &LeadingEdgeTimer::fired);

    timer.trigger();
    timer.trigger();
    timer.cancel();

    QVERIFY(timer.state() == LeadingEdgeTimer::State::Idle);
    QTest::qWait(150);
    QCOMPARE(fired.count(), 1);
}

void ResizeCoordinatorTest::testZeroWindowFiresEveryTime()
{
    LeadingEdgeTimer timer(0);
    QSignalSpy fired(&timer, &LeadingEdgeTimer::fired);

    timer.trigger();
    timer.trigger();

    QCOMPARE(fired.count(), 2);
    QVERIFY(timer.state() == LeadingEdgeTimer::State::Idle);
}

void ResizeCoordinatorTest::testImmediateAppliesAndForwards()
{
    FakeProcessHost host;
    FakeTerminalSurface surface;
    ResizeCoordinator coordinator(&host, 150);
    QSignalSpy resized(&coordinator, &ResizeCoordinator::resized);

    coordinator.setSurface(&surface);
    coordinator.setProcess(QStringLiteral("p1"), QSize(80, 24));
    surface.setProposedDimensions(100, 30);

    coordinator.requestImmediate();

    QCOMPARE(surface.applyCount, 1);
    QCOMPARE(surface.columns(), 100);
    QCOMPARE(surface.lines(), 30);
    QCOMPARE(resized.count(), 1);
    QCOMPARE(resized.at(0).at(0).toInt(), 100);
    QCOMPARE(host.resizes.size(), 1);
    QCOMPARE(host.resizes.at(0).processId, QStringLiteral("p1"));
    QCOMPARE(host.resizes.at(0).columns, 100);
    QCOMPARE(host.resizes.at(0).lines, 30);
    QCOMPARE(coordinator.lastForwardedSize(), QSize(100, 30));
}

void ResizeCoordinatorTest::testCurrentDimensionsAreNotReapplied()
{
    FakeProcessHost host;
    FakeTerminalSurface surface;
    ResizeCoordinator coordinator(&host, 150);
    coordinator.setSurface(&surface);
    coordinator.setProcess(QStringLiteral("p1"), QSize(80, 24));

    coordinator.requestImmediate();
    coordinator.requestDebounced();

    QCOMPARE(surface.applyCount, 0);
    QVERIFY(host.resizes.isEmpty());
}

void ResizeCoordinatorTest::testInvalidProposalIsIgnored()
{
    FakeProcessHost host;
    FakeTerminalSurface surface;
    ResizeCoordinator coordinator(&host, 150);
    coordinator.setSurface(&surface);
    coordinator.setProcess(QStringLiteral("p1"), QSize(80, 24));

    surface.proposed = QSize();
    coordinator.requestImmediate();
    surface.setProposedDimensions(0, 0);
    coordinator.requestImmediate();

    QCOMPARE(surface.applyCount, 0);
    QVERIFY(host.resizes.isEmpty());
}

void ResizeCoordinatorTest::testUnboundResizeOnlyTouchesSurface()
{
    FakeProcessHost host;
    FakeTerminalSurface surface;
    ResizeCoordinator coordinator(&host, 150);
    coordinator.setSurface(&surface);

    surface.setProposedDimensions(120, 40);
    coordinator.requestImmediate();

    QCOMPARE(surface.applyCount, 1);
    QVERIFY(host.resizes.isEmpty());
}

void ResizeCoordinatorTest::testForwardedSizeIsNotResent()
{
    FakeProcessHost host;
    FakeTerminalSurface surface;
    ResizeCoordinator coordinator(&host, 150);
    coordinator.setSurface(&surface);
    coordinator.setProcess(QStringLiteral("p1"), QSize(80, 24));

    surface.setProposedDimensions(100, 30);
    coordinator.requestImmediate();
    QCOMPARE(host.resizes.size(), 1);

    // Surface reset behind our back; the process already has 100x30
    surface.gridColumns = 80;
    surface.gridLines = 24;
    coordinator.requestImmediate();

    QCOMPARE(surface.applyCount, 2);
    QCOMPARE(host.resizes.size(), 1);
}

void ResizeCoordinatorTest::testImmediateSupersedesPendingDebounced()
{
    FakeProcessHost host;
    FakeTerminalSurface surface;
    ResizeCoordinator coordinator(&host, 100);
    coordinator.setSurface(&surface);
    coordinator.setProcess(QStringLiteral("p1"), QSize(80, 24));

    surface.setProposedDimensions(90, 30);
    coordinator.requestDebounced();
    QCOMPARE(surface.applyCount, 1);

    surface.setProposedDimensions(95, 30);
    coordinator.requestDebounced();
    QCOMPARE(surface.applyCount, 1);
    QVERIFY(coordinator.debounceTimer().hasPending());

    surface.setProposedDimensions(120, 40);
    coordinator.requestImmediate();

    QCOMPARE(surface.applyCount, 2);
    QCOMPARE(surface.columns(), 120);
    QCOMPARE(surface.lines(), 40);
    QVERIFY(!coordinator.debounceTimer().hasPending());

    QTest::qWait(300);

    QCOMPARE(surface.applyCount, 2);
    QCOMPARE(host.resizes.size(), 2);
    QCOMPARE(host.resizes.last().columns, 120);
    QCOMPARE(host.resizes.last().lines, 40);
}

void ResizeCoordinatorTest::testDebouncedBurstAppliesLatestGeometry()
{
    FakeProcessHost host;
    FakeTerminalSurface surface;
    ResizeCoordinator coordinator(&host, 50);
    coordinator.setSurface(&surface);
    coordinator.setProcess(QStringLiteral("p1"), QSize(80, 24));

    surface.setProposedDimensions(81, 24);
    coordinator.requestDebounced();
    surface.setProposedDimensions(82, 24);
    coordinator.requestDebounced();
    surface.setProposedDimensions(83, 24);
    coordinator.requestDebounced();

    QCOMPARE(surface.applyCount, 1);
    QCOMPARE(surface.columns(), 81);

    QTRY_COMPARE_WITH_TIMEOUT(surface.applyCount, 2, 1000);
    QCOMPARE(surface.columns(), 83);
    QCOMPARE(host.resizes.size(), 2);
}

void ResizeCoordinatorTest::testScheduledImmediate()
{
    FakeProcessHost host;
    FakeTerminalSurface surface;
    ResizeCoordinator coordinator(&host, 150);
    coordinator.setSurface(&surface);
    surface.setProposedDimensions(100, 30);

    coordinator.scheduleImmediate(30);
    coordinator.stop();
    QTest::qWait(100);
    QCOMPARE(surface.applyCount, 0);

    coordinator.scheduleImmediate(30);
    QCOMPARE(surface.applyCount, 0);
    QTRY_COMPARE_WITH_TIMEOUT(surface.applyCount, 1, 1000);
}

QTEST_GUILESS_MAIN(ResizeCoordinatorTest)

#include "moc_ResizeCoordinatorTest.cpp"
