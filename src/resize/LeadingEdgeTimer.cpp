/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "resize/LeadingEdgeTimer.h"

namespace Termweave
{

LeadingEdgeTimer::LeadingEdgeTimer(int windowMs, QObject *parent)
    : QObject(parent)
{
    _clock.start();
    _window.setSingleShot(true);
    _window.setInterval(qMax(0, windowMs));
    connect(&_window, &QTimer::timeout, this, &LeadingEdgeTimer::onWindowElapsed);
}

void LeadingEdgeTimer::setWindow(int windowMs)
{
    _window.setInterval(qMax(0, windowMs));
}

int LeadingEdgeTimer::window() const
{
    return _window.interval();
}

void LeadingEdgeTimer::trigger()
{
    if (_window.interval() == 0) {
        fire();
        return;
    }

    if (_state != State::Idle) {
        _pending = true;
        return;
    }

    // Arm before firing so a trigger from inside fired() is coalesced
    _state = State::Armed;
    _window.start();
    fire();
}

void LeadingEdgeTimer::cancel()
{
    _window.stop();
    _pending = false;
    _state = State::Idle;
}

void LeadingEdgeTimer::onWindowElapsed()
{
    if (!_pending) {
        _state = State::Idle;
        return;
    }

    _pending = false;
    _state = State::Fired;
    _window.start();
    fire();
}

void LeadingEdgeTimer::fire()
{
    _lastInvoke = _clock.elapsed();
    Q_EMIT fired();
}

} // namespace Termweave

#include "moc_LeadingEdgeTimer.cpp"
