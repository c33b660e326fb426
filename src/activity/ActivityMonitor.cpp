/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "activity/ActivityMonitor.h"

#include "EngineSettings.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcTermweaveActivity, "termweave.activity", QtInfoMsg)

namespace Termweave
{

ActivityMonitor::ActivityMonitor(const EngineSettings &settings, QObject *parent)
    : QObject(parent)
    , _graceThreshold(settings.activityGraceThreshold)
{
    _activityTimer.setSingleShot(true);
    _activityTimer.setInterval(settings.activityTimeoutMs);
    connect(&_activityTimer, &QTimer::timeout, this, &ActivityMonitor::onActivityTimeout);

    _graceTimer.setSingleShot(true);
    _graceTimer.setInterval(settings.activityGraceMs);
    connect(&_graceTimer, &QTimer::timeout, this, &ActivityMonitor::onGraceElapsed);
}

void ActivityMonitor::setTimings(int activityTimeoutMs, int graceMs, int graceThreshold)
{
    _activityTimer.setInterval(activityTimeoutMs);
    _graceTimer.setInterval(graceMs);
    _graceThreshold = graceThreshold;
}

void ActivityMonitor::setActive(bool active)
{
    if (_active == active) {
        return;
    }
    _active = active;

    if (active) {
        // The foreground session never shows a background indicator.
        // The explicit progress flag belongs to the program and stays.
        _graceTimer.stop();
        _graceCount = 0;
        _activityTimer.stop();
        _heuristic = false;
        updateThinking();
        return;
    }

    _graceCount = 0;
    if (_graceTimer.interval() > 0) {
        _graceTimer.start();
    }
}

void ActivityMonitor::recordOutput(const QByteArray &data)
{
    if (_active || data.isEmpty()) {
        return;
    }
    if (_graceTimer.isActive()) {
        _graceCount++;
        return;
    }
    triggerHeuristic();
}

void ActivityMonitor::recordTitleChange()
{
    if (_active) {
        return;
    }
    triggerHeuristic();
}

void ActivityMonitor::setProgressState(int state)
{
    const bool busy = state != 0;
    if (_explicit == busy) {
        return;
    }
    qCDebug(lcTermweaveActivity) << "progress report, state" << state;
    _explicit = busy;
    updateThinking();
}

void ActivityMonitor::reset()
{
    _graceTimer.stop();
    _activityTimer.stop();
    _graceCount = 0;
    _heuristic = false;
    _explicit = false;
    updateThinking();
}

void ActivityMonitor::triggerHeuristic()
{
    _activityTimer.start();
    if (!_heuristic) {
        _heuristic = true;
        updateThinking();
    }
}

void ActivityMonitor::onGraceElapsed()
{
    const int count = _graceCount;
    _graceCount = 0;
    if (count > 0 && count >= _graceThreshold) {
        qCDebug(lcTermweaveActivity) << count << "output events during grace period, arming activity timer";
        triggerHeuristic();
    }
}

void ActivityMonitor::onActivityTimeout()
{
    _heuristic = false;
    updateThinking();
}

void ActivityMonitor::updateThinking()
{
    const bool thinking = isThinking();
    if (thinking == _reportedThinking) {
        return;
    }
    _reportedThinking = thinking;
    Q_EMIT thinkingChanged(thinking);
}

} // namespace Termweave

#include "moc_ActivityMonitor.cpp"
