/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "renderer/CursorVisibilityGuard.h"

#include "surface/TerminalSurface.h"

namespace Termweave
{

CursorVisibilityGuard::CursorVisibilityGuard(int minIntervalMs, int rowTolerance, int anchorWindowMs)
    : _minIntervalMs(minIntervalMs)
    , _rowTolerance(rowTolerance)
    , _anchorWindowMs(anchorWindowMs)
{
}

void CursorVisibilityGuard::setSurface(TerminalSurface *surface)
{
    _surface = surface;
}

void CursorVisibilityGuard::setThresholds(int minIntervalMs, int rowTolerance, int anchorWindowMs)
{
    _minIntervalMs = minIntervalMs;
    _rowTolerance = rowTolerance;
    _anchorWindowMs = anchorWindowMs;
}

void CursorVisibilityGuard::anchor()
{
    _sinceAnchor.start();
}

bool CursorVisibilityGuard::update(bool force)
{
    if (_suppressed) {
        _suppressedUpdates++;
        return false;
    }
    if (!_surface) {
        return false;
    }

    if (!force) {
        if (!_sinceAnchor.isValid() || _sinceAnchor.elapsed() > _anchorWindowMs) {
            return false;
        }
    }

    const int outside = rowsOutsideViewport();
    if (outside == 0 || outside < _rowTolerance) {
        return false;
    }

    if (!force && _sinceScroll.isValid() && _sinceScroll.elapsed() < _minIntervalMs) {
        return false;
    }

    _surface->scrollToCursor();
    _sinceScroll.start();
    return true;
}

void CursorVisibilityGuard::setSuppressed(bool suppressed)
{
    _suppressed = suppressed;
    if (suppressed) {
        _suppressedUpdates = 0;
    }
}

void CursorVisibilityGuard::reset()
{
    _sinceAnchor.invalidate();
    _sinceScroll.invalidate();
    _suppressedUpdates = 0;
}

int CursorVisibilityGuard::rowsOutsideViewport() const
{
    if (!_surface) {
        return 0;
    }

    const int cursor = _surface->cursorLine();
    const int top = _surface->viewportTopLine();
    const int bottom = top + qMax(1, _surface->lines()) - 1;

    if (cursor < top) {
        return top - cursor;
    } else if (cursor > bottom) {
        return cursor - bottom;
    }
    return 0;
}

} // namespace Termweave
