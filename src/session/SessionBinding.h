/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONBINDING_H
#define SESSIONBINDING_H

#include <QByteArray>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QSize>
#include <QString>

#include "EngineSettings.h"
#include "output/EscapeSequenceNormalizer.h"
#include "output/OutputBuffer.h"
#include "renderer/CompositionGuard.h"
#include "renderer/CursorVisibilityGuard.h"
#include "session/HostEvent.h"
#include "session/ProcessHost.h"
#include "termweaveprivate_export.h"

namespace Termweave
{

class ActivityMonitor;
class OscHandler;
class RendererController;
class ResizeCoordinator;
class TerminalEngine;
class TerminalSurface;

/**
 * Binds one terminal surface to one host process.
 *
 * The binding outlives its surface: a surface can be detached (tab
 * hidden, view recreated) and another one attached without the process
 * noticing; output produced in between is queued. The process is only
 * killed by close() or restart().
 *
 * Host events that arrive while a spawn is in flight are kept in order
 * and replayed once the process id is known. Events for any other id
 * are dropped.
 */
class TERMWEAVEPRIVATE_EXPORT SessionBinding : public QObject
{
    Q_OBJECT
public:
    enum State {
        Unbound,
        Spawning,
        Bound,
        Exited,
    };
    Q_ENUM(State)

    SessionBinding(TerminalEngine *engine, const SpawnTarget &target, QObject *parent = nullptr);
    ~SessionBinding() override;

    /** Starts the process. Returns false if one is running or starting. */
    bool spawn();

    /** Kills the current process, clears the surface and spawns again. */
    bool restart();
    bool restart(const SpawnTarget &target);

    /** Replaces the running program with a plain shell for the same entity. */
    bool launchShell();

    /** Kills the process and releases every resource. Emits closed(). */
    void close();

    void attachSurface(TerminalSurface *surface);
    void detachSurface();
    TerminalSurface *surface() const;

    void setActive(bool active);
    bool isActive() const
    {
        return _active;
    }

    void setVisible(bool visible);
    bool isVisible() const
    {
        return _visible;
    }

    bool sendInput(const QByteArray &data);

    State state() const
    {
        return _state;
    }
    QString processId() const
    {
        return _processId;
    }
    const SpawnTarget &target() const
    {
        return _target;
    }
    QString title() const
    {
        return _title;
    }
    QString currentDirectory() const
    {
        return _cwd;
    }
    int exitCode() const
    {
        return _exitCode;
    }
    bool isThinking() const;
    int pendingEarlyEvents() const
    {
        return _earlyEvents.size();
    }

    ResizeCoordinator *resizeCoordinator() const
    {
        return _resize;
    }
    RendererController *rendererController() const
    {
        return _renderer;
    }
    ActivityMonitor *activityMonitor() const
    {
        return _activity;
    }
    const OutputBuffer &outputBuffer() const
    {
        return _output;
    }

Q_SIGNALS:
    void stateChanged(Termweave::SessionBinding::State state);
    void processIdReady(const QString &processId);
    void exited(int exitCode);
    void spawnFailed(const QString &message);
    void focused();
    void titleChanged(const QString &title);
    void thinkingChanged(bool thinking);
    void cwdChanged(const QString &path);
    void notificationRaised(const QString &title, const QString &body);
    void closed();

private:
    void setState(State state);
    QSize initialSize() const;
    void onSpawnFinished(bool success, const QString &processId, const QString &error, const QSize &size);
    void teardownProcess();

    void onHostOutput(const QString &processId, const QByteArray &data);
    void onHostExit(const QString &processId, int exitCode);
    void dispatch(const HostEvent &event);
    void applyOutput(const QByteArray &data);
    void applyExit(int exitCode);

    void onSurfaceTitleChanged(const QString &title);
    void onSelectionDragStarted();
    void onSelectionDragFinished();
    void onSurfaceGeometryChanged();
    void onSurfaceAboutToBeDestroyed();
    void onSurfaceDestroyed();
    void onPanelResizeStarted();
    void onPanelResizeCompleted();
    void releaseSurface();
    void updatePaused();

    QPointer<TerminalEngine> _engine;
    QPointer<ProcessHost> _host;
    EngineSettings _settings;
    SpawnTarget _target;

    QPointer<TerminalSurface> _surface;
    State _state = Unbound;
    QString _processId;
    quint64 _spawnGeneration = 0;
    QList<HostEvent> _earlyEvents;
    bool _replaying = false;
    int _exitCode = -1;

    bool _active = false;
    bool _visible = true;
    bool _selecting = false;
    QString _title;
    QString _cwd;

    EscapeSequenceNormalizer _normalizer;
    OutputBuffer _output;
    CursorVisibilityGuard _cursorGuard;
    CompositionGuard _compositionGuard;

    ResizeCoordinator *_resize;
    RendererController *_renderer;
    ActivityMonitor *_activity;
    OscHandler *_osc;
};

} // namespace Termweave

#endif // SESSIONBINDING_H
