/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RENDERERCONTROLLER_H
#define RENDERERCONTROLLER_H

#include <QObject>
#include <QPointer>
#include <QTimer>

#include <memory>

#include "EngineSettings.h"
#include "termweaveprivate_export.h"

namespace Termweave
{

class RendererBackend;
class RendererContextArbiter;
class TerminalSurface;

/**
 * Loads and unloads the accelerated renderer of one surface.
 *
 * The backend is loaded when the mode allows it (On, or Auto while the
 * session is active), the controller is not suspended and the arbiter
 * hands out the GPU context. Context loss and load failures fall back
 * to software rendering; the surface itself is never touched beyond
 * a repaint.
 */
class TERMWEAVEPRIVATE_EXPORT RendererController : public QObject
{
    Q_OBJECT
public:
    RendererController(RendererContextArbiter *arbiter, const EngineSettings &settings, QObject *parent = nullptr);
    ~RendererController() override;

    void setSurface(TerminalSurface *surface);

    void setMode(RendererMode mode);
    RendererMode mode() const
    {
        return _mode;
    }

    void setActive(bool active);
    bool isActive() const
    {
        return _active;
    }

    /** Drops the backend for the duration of a disruptive reflow. */
    void suspend();
    void resume();
    bool isSuspended() const
    {
        return _suspended;
    }

    /** Clears the glyph cache (pixel ratio changed) and repaints. */
    void refresh();

    void dispose();

    bool isLoaded() const
    {
        return _backend != nullptr;
    }

    int recoveryAttempts() const
    {
        return _recoveryAttempts;
    }

    /** Called by the arbiter when another controller takes the GPU context. */
    void releaseContext();

Q_SIGNALS:
    void loadedChanged(bool loaded);

private:
    bool shouldLoad() const;
    void evaluate();
    void load();
    void unload();
    void onContextLost();

    QPointer<RendererContextArbiter> _arbiter;
    QPointer<TerminalSurface> _surface;
    std::unique_ptr<RendererBackend> _backend;

    RendererMode _mode;
    bool _active = false;
    bool _suspended = false;
    bool _disposed = false;

    QTimer _recoveryTimer;
    int _recoveryAttempts = 0;
    int _maxRecoveryAttempts;
};

} // namespace Termweave

#endif // RENDERERCONTROLLER_H
