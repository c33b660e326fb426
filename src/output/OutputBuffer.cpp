/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "output/OutputBuffer.h"

#include "surface/TerminalSurface.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcTermweaveOutput, "termweave.output", QtInfoMsg)

namespace Termweave
{

OutputBuffer::OutputBuffer(TerminalSurface *surface)
    : _surface(surface)
{
}

void OutputBuffer::setAfterWriteCallback(AfterWriteCallback callback)
{
    _afterWrite = std::move(callback);
}

void OutputBuffer::setSurface(TerminalSurface *surface)
{
    _surface = surface;
    if (surface) {
        _disposed = false;
    }
    if (!_paused) {
        flush();
    }
}

TerminalSurface *OutputBuffer::surface() const
{
    return _surface.data();
}

void OutputBuffer::write(const QByteArray &data)
{
    if (data.isEmpty()) {
        return;
    }
    if (_disposed) {
        qCWarning(lcTermweaveOutput) << "write after dispose, dropping" << data.size() << "bytes";
        return;
    }

    if (_paused || !_pending.isEmpty() || !_surface) {
        _pending.append(data);
        if (!_paused) {
            flush();
        }
        return;
    }

    writeToSurface(data);
}

void OutputBuffer::pause()
{
    _paused = true;
}

void OutputBuffer::resume()
{
    if (!_paused) {
        return;
    }
    _paused = false;
    flush();
}

void OutputBuffer::flush()
{
    if (_pending.isEmpty() || !_surface) {
        return;
    }

    qCDebug(lcTermweaveOutput) << "flushing" << _pending.size() << "queued bytes";

    QByteArray queued;
    queued.swap(_pending);
    writeToSurface(queued);
}

void OutputBuffer::dispose()
{
    flush();
    if (!_pending.isEmpty()) {
        qCWarning(lcTermweaveOutput) << "disposed without a surface," << _pending.size() << "bytes kept queued";
    }
    _surface = nullptr;
    _disposed = true;
}

void OutputBuffer::discard()
{
    if (!_pending.isEmpty()) {
        qCDebug(lcTermweaveOutput) << "discarding" << _pending.size() << "queued bytes";
    }
    _pending.clear();
}

void OutputBuffer::writeToSurface(const QByteArray &data)
{
    _surface->write(data);
    if (_afterWrite) {
        _afterWrite();
    }
}

} // namespace Termweave
