/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef COMPOSITIONGUARD_H
#define COMPOSITIONGUARD_H

#include <QPointer>

#include "termweaveprivate_export.h"

namespace Termweave
{

class CursorVisibilityGuard;
class TerminalSurface;

/**
 * Pins the rendered cursor during IME composition.
 *
 * Composing CJK text produces many intermediate renders; while locked
 * the cursor stays pinned and forced scrolls are held back. Unlocking
 * re-applies the cursor update once if any was held back.
 */
class TERMWEAVEPRIVATE_EXPORT CompositionGuard
{
public:
    explicit CompositionGuard(CursorVisibilityGuard *cursorGuard);

    void setSurface(TerminalSurface *surface);

    void lock();
    void unlock();

    bool isLocked() const
    {
        return _locked;
    }

private:
    CursorVisibilityGuard *_cursorGuard;
    QPointer<TerminalSurface> _surface;
    bool _locked = false;
};

} // namespace Termweave

#endif // COMPOSITIONGUARD_H
