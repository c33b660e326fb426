/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RESIZECOORDINATOR_H
#define RESIZECOORDINATOR_H

#include <QObject>
#include <QPointer>
#include <QSize>
#include <QString>
#include <QTimer>

#include "resize/LeadingEdgeTimer.h"
#include "termweaveprivate_export.h"

namespace Termweave
{

class ProcessHost;
class TerminalSurface;

/**
 * Keeps the surface grid and the process terminal size in sync.
 *
 * requestDebounced() is meant for the stream of geometry notifications
 * produced while a panel is dragged, requestImmediate() for "the layout
 * has settled, resize now". Both end in resolveAndApply(), which does
 * nothing if the proposed grid is already in place.
 */
class TERMWEAVEPRIVATE_EXPORT ResizeCoordinator : public QObject
{
    Q_OBJECT
public:
    ResizeCoordinator(ProcessHost *host, int debounceMs, QObject *parent = nullptr);

    void setSurface(TerminalSurface *surface);

    /**
     * Binds the coordinator to a process that was spawned with
     * spawnedSize. An empty id unbinds; resizes then only touch the surface.
     */
    void setProcess(const QString &processId, const QSize &spawnedSize);

    void requestImmediate();
    void requestDebounced();

    /** Immediate resize after delayMs, unless canceled by stop() first. */
    void scheduleImmediate(int delayMs);

    /** Cancels every pending resize. */
    void stop();

    void setDebounceWindow(int debounceMs);

    QSize lastForwardedSize() const
    {
        return _lastForwarded;
    }

    const LeadingEdgeTimer &debounceTimer() const
    {
        return _debounce;
    }

Q_SIGNALS:
    /** The surface grid was changed to columns x lines. */
    void resized(int columns, int lines);

private:
    bool resolveAndApply();

    ProcessHost *_host;
    QPointer<TerminalSurface> _surface;
    QString _processId;
    QSize _lastForwarded;

    LeadingEdgeTimer _debounce;
    QTimer _delayedImmediate;
};

} // namespace Termweave

#endif // RESIZECOORDINATOR_H
