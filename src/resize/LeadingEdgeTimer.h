/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LEADINGEDGETIMER_H
#define LEADINGEDGETIMER_H

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>

#include "termweaveprivate_export.h"

namespace Termweave
{

/**
 * Coalesces bursts of requests, firing on the leading edge.
 *
 * Idle: a trigger fires immediately and arms the window.
 * Armed/Fired: triggers are remembered and fire once when the window
 * ends. A trailing fire re-opens the window, so a continuous burst
 * fires at most once per window. A window that ends with nothing
 * pending returns to Idle.
 */
class TERMWEAVEPRIVATE_EXPORT LeadingEdgeTimer : public QObject
{
    Q_OBJECT
public:
    enum class State { Idle, Armed, Fired };

    explicit LeadingEdgeTimer(int windowMs, QObject *parent = nullptr);

    void setWindow(int windowMs);
    int window() const;

    void trigger();

    /** Drops a pending trailing fire and returns to Idle. */
    void cancel();

    State state() const
    {
        return _state;
    }

    bool hasPending() const
    {
        return _pending;
    }

    /** Milliseconds since the clock started at the last fire, -1 if never fired. */
    qint64 lastInvokeTimestamp() const
    {
        return _lastInvoke;
    }

Q_SIGNALS:
    void fired();

private:
    void onWindowElapsed();
    void fire();

    QTimer _window;
    QElapsedTimer _clock;
    State _state = State::Idle;
    bool _pending = false;
    qint64 _lastInvoke = -1;
};

} // namespace Termweave

#endif // LEADINGEDGETIMER_H
