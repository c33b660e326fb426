/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CURSORVISIBILITYGUARD_H
#define CURSORVISIBILITYGUARD_H

#include <QElapsedTimer>
#include <QPointer>

#include "termweaveprivate_export.h"

namespace Termweave
{

class TerminalSurface;

/**
 * Scrolls the cursor back into view while the user is typing.
 *
 * anchor() marks a keystroke; update() runs after every buffered write.
 * A scroll is only issued within the anchor window after the last
 * keystroke, when the cursor is at least rowTolerance rows outside the
 * viewport, and at most once per minimum interval.
 */
class TERMWEAVEPRIVATE_EXPORT CursorVisibilityGuard
{
public:
    CursorVisibilityGuard(int minIntervalMs, int rowTolerance, int anchorWindowMs);

    void setSurface(TerminalSurface *surface);
    void setThresholds(int minIntervalMs, int rowTolerance, int anchorWindowMs);

    void anchor();

    /**
     * Returns true if a scroll was issued. force skips the anchor and
     * interval checks, not the row tolerance.
     */
    bool update(bool force = false);

    /** While suppressed, update() only counts how often it was called. */
    void setSuppressed(bool suppressed);
    bool isSuppressed() const
    {
        return _suppressed;
    }
    int suppressedUpdates() const
    {
        return _suppressedUpdates;
    }

    void reset();

    /** Rows between the cursor and the nearest viewport edge, 0 if visible. */
    int rowsOutsideViewport() const;

private:
    QPointer<TerminalSurface> _surface;
    int _minIntervalMs;
    int _rowTolerance;
    int _anchorWindowMs;

    QElapsedTimer _sinceAnchor;
    QElapsedTimer _sinceScroll;
    bool _suppressed = false;
    int _suppressedUpdates = 0;
};

} // namespace Termweave

#endif // CURSORVISIBILITYGUARD_H
