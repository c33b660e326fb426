/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ACTIVITYMONITOR_H
#define ACTIVITYMONITOR_H

#include <QByteArray>
#include <QObject>
#include <QTimer>

#include "termweaveprivate_export.h"

namespace Termweave
{

struct EngineSettings;

/**
 * Derives the "thinking" indicator of a session.
 *
 * Two independent sources are OR-ed together:
 *  - heuristic: output or title changes while the session is in the
 *    background keep a retriggerable timer running;
 *  - explicit: progress reports (OSC 9;4) set and clear a flag directly.
 *
 * Right after a session goes to the background, output is only counted
 * for a grace period, since switching tabs makes most programs redraw.
 * If enough output arrived by the end of the grace period the heuristic
 * timer is armed then.
 */
class TERMWEAVEPRIVATE_EXPORT ActivityMonitor : public QObject
{
    Q_OBJECT
public:
    explicit ActivityMonitor(const EngineSettings &settings, QObject *parent = nullptr);

    void setTimings(int activityTimeoutMs, int graceMs, int graceThreshold);

    void setActive(bool active);
    bool isActive() const
    {
        return _active;
    }

    void recordOutput(const QByteArray &data);
    void recordTitleChange();

    /** Progress state of OSC 9;4: 0 = hidden/done, anything else = busy. */
    void setProgressState(int state);

    /** Clears both sources and every pending timer. */
    void reset();

    bool isThinking() const
    {
        return _heuristic || _explicit;
    }
    bool heuristicThinking() const
    {
        return _heuristic;
    }
    bool explicitThinking() const
    {
        return _explicit;
    }
    bool inGracePeriod() const
    {
        return _graceTimer.isActive();
    }
    int graceCount() const
    {
        return _graceCount;
    }

Q_SIGNALS:
    void thinkingChanged(bool thinking);

private:
    void triggerHeuristic();
    void onGraceElapsed();
    void onActivityTimeout();
    void updateThinking();

    QTimer _activityTimer;
    QTimer _graceTimer;
    int _graceThreshold;

    bool _active = false;
    bool _heuristic = false;
    bool _explicit = false;
    bool _reportedThinking = false;
    int _graceCount = 0;
};

} // namespace Termweave

#endif // ACTIVITYMONITOR_H
