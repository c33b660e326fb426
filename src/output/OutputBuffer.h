/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef OUTPUTBUFFER_H
#define OUTPUTBUFFER_H

#include <QByteArray>
#include <QPointer>

#include <functional>

#include "termweaveprivate_export.h"

namespace Termweave
{

class TerminalSurface;

/**
 * Sits between the process output stream and the surface.
 *
 * Unpaused writes go straight to the surface; interactive echo latency
 * matters more than coalescing. While paused (hidden session, selection
 * drag, no surface attached) output is queued and written in order on
 * resume. Queued bytes are never dropped.
 */
class TERMWEAVEPRIVATE_EXPORT OutputBuffer
{
public:
    using AfterWriteCallback = std::function<void()>;

    explicit OutputBuffer(TerminalSurface *surface = nullptr);

    void setAfterWriteCallback(AfterWriteCallback callback);

    /** Retargets the buffer. Output is queued while no surface is attached. */
    void setSurface(TerminalSurface *surface);
    TerminalSurface *surface() const;

    void write(const QByteArray &data);

    void pause();
    void resume();

    /** Writes out everything queued without changing the paused state. */
    void flush();

    /** Drains the queue into the current surface and detaches from it. */
    void dispose();

    /** Drops everything queued, for when the surface is about to be cleared. */
    void discard();

    bool isPaused() const
    {
        return _paused;
    }

    int pendingBytes() const
    {
        return int(_pending.size());
    }

private:
    void writeToSurface(const QByteArray &data);

    QPointer<TerminalSurface> _surface;
    AfterWriteCallback _afterWrite;
    QByteArray _pending;
    bool _paused = false;
    bool _disposed = false;
};

} // namespace Termweave

#endif // OUTPUTBUFFER_H
