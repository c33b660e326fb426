/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RESIZECOORDINATORTEST_H
#define RESIZECOORDINATORTEST_H

#include <QObject>

namespace Termweave
{

class ResizeCoordinatorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testLeadingEdgeFiresImmediately();
    void testBurstCoalescesIntoOneTrailingFire();
    void testCancelDropsTrailingFire();
    void testZeroWindowFiresEveryTime();

    void testImmediateAppliesAndForwards();
    void testCurrentDimensionsAreNotReapplied();
    void testInvalidProposalIsIgnored();
    void testUnboundResizeOnlyTouchesSurface();
    void testForwardedSizeIsNotResent();
    void testImmediateSupersedesPendingDebounced();
    void testDebouncedBurstAppliesLatestGeometry();
    void testScheduledImmediate();
};

}

#endif // RESIZECOORDINATORTEST_H
