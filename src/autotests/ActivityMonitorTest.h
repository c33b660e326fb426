/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ACTIVITYMONITORTEST_H
#define ACTIVITYMONITORTEST_H

#include <QObject>

namespace Termweave
{

class ActivityMonitorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testBackgroundOutputSetsThinking();
    void testActivityTimeoutClearsThinking();
    void testOutputWhileActiveIsIgnored();
    void testGraceThresholdArmsAtExpiry();
    void testSingleGraceEventNeverSets();
    void testTitleChangeBypassesGrace();
    void testActivationClearsHeuristic();
    void testProgressWhileActive();
    void testProgressIsNotGatedByFocus();
    void testHeuristicAndProgressAreCombined();
    void testResetClearsBoth();
};

}

#endif // ACTIVITYMONITORTEST_H
