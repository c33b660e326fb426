/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "resize/ResizeCoordinator.h"

#include "session/ProcessHost.h"
#include "surface/TerminalSurface.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcTermweaveResize, "termweave.resize", QtInfoMsg)

namespace Termweave
{

ResizeCoordinator::ResizeCoordinator(ProcessHost *host, int debounceMs, QObject *parent)
    : QObject(parent)
    , _host(host)
    , _debounce(debounceMs)
{
    connect(&_debounce, &LeadingEdgeTimer::fired, this, &ResizeCoordinator::resolveAndApply);

    _delayedImmediate.setSingleShot(true);
    connect(&_delayedImmediate, &QTimer::timeout, this, &ResizeCoordinator::requestImmediate);
}

void ResizeCoordinator::setSurface(TerminalSurface *surface)
{
    _surface = surface;
}

void ResizeCoordinator::setProcess(const QString &processId, const QSize &spawnedSize)
{
    _processId = processId;
    _lastForwarded = processId.isEmpty() ? QSize() : spawnedSize;
}

void ResizeCoordinator::requestImmediate()
{
    // The immediate geometry wins; a pending trailing resize would only
    // re-apply an older proposal.
    _debounce.cancel();
    _delayedImmediate.stop();
    resolveAndApply();
}

void ResizeCoordinator::requestDebounced()
{
    _debounce.trigger();
}

void ResizeCoordinator::scheduleImmediate(int delayMs)
{
    _delayedImmediate.start(qMax(0, delayMs));
}

void ResizeCoordinator::stop()
{
    _debounce.cancel();
    _delayedImmediate.stop();
}

void ResizeCoordinator::setDebounceWindow(int debounceMs)
{
    _debounce.setWindow(debounceMs);
}

bool ResizeCoordinator::resolveAndApply()
{
    if (!_surface) {
        return false;
    }

    const QSize proposed = _surface->proposeDimensions();
    if (!proposed.isValid() || proposed.isEmpty()) {
        // Not laid out yet (hidden, zero-sized container)
        return false;
    }

    const int columns = proposed.width();
    const int lines = proposed.height();
    const bool surfaceChanged = columns != _surface->columns() || lines != _surface->lines();
    const bool processChanged = !_processId.isEmpty() && proposed != _lastForwarded;

    if (!surfaceChanged && !processChanged) {
        return false;
    }

    if (surfaceChanged) {
        qCDebug(lcTermweaveResize) << "applying" << columns << "x" << lines << "to surface";
        _surface->applyDimensions(columns, lines);
        Q_EMIT resized(columns, lines);
    }

    if (processChanged) {
        qCDebug(lcTermweaveResize) << "resizing process" << _processId << "to" << columns << "x" << lines;
        _lastForwarded = proposed;
        _host->resize(_processId, columns, lines);
    }
    return true;
}

} // namespace Termweave

#include "moc_ResizeCoordinator.cpp"
