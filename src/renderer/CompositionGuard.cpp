/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "renderer/CompositionGuard.h"

#include "renderer/CursorVisibilityGuard.h"
#include "surface/TerminalSurface.h"

namespace Termweave
{

CompositionGuard::CompositionGuard(CursorVisibilityGuard *cursorGuard)
    : _cursorGuard(cursorGuard)
{
}

void CompositionGuard::setSurface(TerminalSurface *surface)
{
    if (_locked && _surface && _surface != surface) {
        _surface->setCursorPinned(false);
    }
    _surface = surface;
    if (_locked && _surface) {
        _surface->setCursorPinned(true);
    }
}

void CompositionGuard::lock()
{
    if (_locked) {
        return;
    }
    _locked = true;
    _cursorGuard->setSuppressed(true);
    if (_surface) {
        _surface->setCursorPinned(true);
    }
}

void CompositionGuard::unlock()
{
    if (!_locked) {
        return;
    }
    _locked = false;
    if (_surface) {
        _surface->setCursorPinned(false);
    }

    const int heldBack = _cursorGuard->suppressedUpdates();
    _cursorGuard->setSuppressed(false);
    if (heldBack > 0) {
        _cursorGuard->update(true);
    }
}

} // namespace Termweave
