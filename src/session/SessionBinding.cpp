/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "session/SessionBinding.h"

#include "PanelResizeBus.h"
#include "TerminalEngine.h"
#include "activity/ActivityMonitor.h"
#include "activity/OscHandler.h"
#include "renderer/RendererController.h"
#include "resize/ResizeCoordinator.h"
#include "session/ExitStatus.h"
#include "surface/TerminalSurface.h"

#include <QLoggingCategory>

#include <utility>

Q_LOGGING_CATEGORY(lcTermweaveSession, "termweave.session", QtInfoMsg)

namespace Termweave
{

namespace
{
// Used when the surface is not laid out yet at spawn time
const QSize FallbackSize(80, 24);
}

SessionBinding::SessionBinding(TerminalEngine *engine, const SpawnTarget &target, QObject *parent)
    : QObject(parent)
    , _engine(engine)
    , _host(engine->processHost())
    , _settings(engine->settings())
    , _target(target)
    , _cursorGuard(_settings.cursorScrollIntervalMs, _settings.cursorRowTolerance, _settings.cursorAnchorWindowMs)
    , _compositionGuard(&_cursorGuard)
    , _resize(new ResizeCoordinator(engine->processHost(), _settings.resizeDebounceMs, this))
    , _renderer(new RendererController(engine->rendererArbiter(), _settings, this))
    , _activity(new ActivityMonitor(_settings, this))
    , _osc(new OscHandler(this))
{
    _output.setAfterWriteCallback([this]() {
        _cursorGuard.update();
    });

    connect(_host.data(), &ProcessHost::outputReceived, this, &SessionBinding::onHostOutput);
    connect(_host.data(), &ProcessHost::processExited, this, &SessionBinding::onHostExit);

    connect(_activity, &ActivityMonitor::thinkingChanged, this, &SessionBinding::thinkingChanged);

    connect(_osc, &OscHandler::progressReported, _activity, [this](int state, int) {
        _activity->setProgressState(state);
    });
    connect(_osc, &OscHandler::notificationRaised, this, &SessionBinding::notificationRaised);
    connect(_osc, &OscHandler::cwdChanged, this, [this](const QString &path) {
        if (_cwd == path) {
            return;
        }
        _cwd = path;
        Q_EMIT cwdChanged(path);
    });

    PanelResizeBus *bus = engine->panelResizeBus();
    connect(bus, &PanelResizeBus::resizeStarted, this, &SessionBinding::onPanelResizeStarted);
    connect(bus, &PanelResizeBus::resizeCompleted, this, &SessionBinding::onPanelResizeCompleted);

    engine->registerBinding(this);
}

SessionBinding::~SessionBinding()
{
    // The process is left running; only close() ends it.
    if (_surface) {
        disconnect(_surface.data(), nullptr, this, nullptr);
    }
    if (_engine) {
        _engine->unregisterBinding(this);
    }
}

bool SessionBinding::isThinking() const
{
    return _activity->isThinking();
}

TerminalSurface *SessionBinding::surface() const
{
    return _surface.data();
}

void SessionBinding::setState(State state)
{
    if (_state == state) {
        return;
    }
    _state = state;
    Q_EMIT stateChanged(state);
}

QSize SessionBinding::initialSize() const
{
    if (!_surface) {
        return FallbackSize;
    }
    const QSize proposed = _surface->proposeDimensions();
    if (proposed.isValid() && !proposed.isEmpty()) {
        return proposed;
    }
    if (_surface->columns() > 0 && _surface->lines() > 0) {
        return QSize(_surface->columns(), _surface->lines());
    }
    return FallbackSize;
}

bool SessionBinding::spawn()
{
    if (_state == Spawning || _state == Bound) {
        qCWarning(lcTermweaveSession) << "spawn() while" << _state << "- ignored";
        return false;
    }
    if (!_host) {
        qCWarning(lcTermweaveSession) << "spawn() without a process host";
        return false;
    }

    const QSize size = initialSize();
    const quint64 generation = ++_spawnGeneration;
    _earlyEvents.clear();
    _exitCode = -1;
    setState(Spawning);

    qCDebug(lcTermweaveSession) << "spawning" << spawnTargetKindName(_target.kind) << _target.entityId << "at" << size.width() << "x" << size.height();

    QPointer<SessionBinding> self(this);
    QPointer<ProcessHost> host(_host);
    _host->spawn(_target, size.width(), size.height(), [self, host, generation, size](bool success, const QString &processId, const QString &error) {
        if (!self || self->_spawnGeneration != generation) {
            // Binding closed, restarted or gone while the spawn was in flight
            if (success && host) {
                qCInfo(lcTermweaveSession) << "killing orphaned process" << processId;
                host->kill(processId);
            }
            return;
        }
        self->onSpawnFinished(success, processId, error, size);
    });
    return true;
}

void SessionBinding::onSpawnFinished(bool success, const QString &processId, const QString &error, const QSize &size)
{
    if (!success || processId.isEmpty()) {
        const QString reason = error.isEmpty() ? QStringLiteral("unknown error") : error;
        const QString message = QStringLiteral("Failed to start %1: %2").arg(spawnTargetKindName(_target.kind), reason);
        qCWarning(lcTermweaveSession) << message;

        _earlyEvents.clear();
        _output.write(QByteArrayLiteral("\r\n\x1b[31m") + message.toUtf8() + QByteArrayLiteral("\x1b[0m\r\n"));
        setState(Unbound);
        Q_EMIT spawnFailed(message);
        return;
    }

    _processId = processId;
    _resize->setProcess(processId, size);
    setState(Bound);
    qCDebug(lcTermweaveSession) << "process" << processId << "ready," << _earlyEvents.size() << "early events";

    // Anything delivered from here until the queue is empty, including
    // events raised by processIdReady handlers, goes behind the queue
    const quint64 generation = _spawnGeneration;
    _replaying = true;
    Q_EMIT processIdReady(processId);

    while (_spawnGeneration == generation && _state == Bound && !_earlyEvents.isEmpty()) {
        const HostEvent event = _earlyEvents.takeFirst();
        if (hostEventProcessId(event) != processId) {
            qCDebug(lcTermweaveSession) << "dropping early event for" << hostEventProcessId(event);
            continue;
        }
        dispatch(event);
    }
    if (_spawnGeneration != generation) {
        // Restarted or closed from a handler; the new spawn owns the queue
        return;
    }
    _replaying = false;
    _earlyEvents.clear();

    if (_state == Bound && _active) {
        _resize->requestImmediate();
    }
}

bool SessionBinding::restart()
{
    return restart(_target);
}

bool SessionBinding::restart(const SpawnTarget &target)
{
    teardownProcess();
    // Nothing of the old process may reach the cleared surface
    _output.discard();
    _target = target;
    _activity->reset();
    _cursorGuard.reset();
    _title.clear();
    if (_surface) {
        _surface->clear();
    }
    return spawn();
}

bool SessionBinding::launchShell()
{
    SpawnTarget shell = _target;
    shell.kind = SpawnTarget::Kind::Shell;
    return restart(shell);
}

void SessionBinding::teardownProcess()
{
    // Invalidates any spawn callback still in flight
    ++_spawnGeneration;
    _earlyEvents.clear();
    _replaying = false;
    _resize->stop();

    if (_state == Bound && _host) {
        qCDebug(lcTermweaveSession) << "killing process" << _processId;
        _host->kill(_processId);
    }

    const QByteArray residual = _normalizer.flush();
    if (!residual.isEmpty()) {
        _output.write(residual);
    }

    _processId.clear();
    _resize->setProcess(QString(), QSize());
    setState(Unbound);
}

void SessionBinding::close()
{
    qCDebug(lcTermweaveSession) << "closing binding for" << _target.entityId;

    teardownProcess();
    _activity->reset();

    if (_engine) {
        PanelResizeBus *bus = _engine->panelResizeBus();
        disconnect(bus, nullptr, this, nullptr);
    }
    if (_host) {
        disconnect(_host.data(), nullptr, this, nullptr);
    }

    _output.dispose();
    _renderer->dispose();
    detachSurface();

    if (_engine) {
        _engine->unregisterBinding(this);
    }
    Q_EMIT closed();
}

void SessionBinding::onHostOutput(const QString &processId, const QByteArray &data)
{
    if (_state == Spawning || _replaying) {
        _earlyEvents.append(HostOutputEvent{processId, data});
        return;
    }
    if (_state != Bound || processId != _processId) {
        return;
    }
    applyOutput(data);
}

void SessionBinding::onHostExit(const QString &processId, int exitCode)
{
    if (_state == Spawning || _replaying) {
        _earlyEvents.append(HostExitEvent{processId, exitCode});
        return;
    }
    if (_state != Bound || processId != _processId) {
        return;
    }
    applyExit(exitCode);
}

void SessionBinding::dispatch(const HostEvent &event)
{
    if (const auto *output = std::get_if<HostOutputEvent>(&event)) {
        applyOutput(output->data);
    } else if (const auto *exit = std::get_if<HostExitEvent>(&event)) {
        applyExit(exit->exitCode);
    }
}

void SessionBinding::applyOutput(const QByteArray &data)
{
    const QByteArray normalized = _normalizer.normalize(data);
    if (!normalized.isEmpty()) {
        _output.write(normalized);
    }
    _activity->recordOutput(data);
}

void SessionBinding::applyExit(int exitCode)
{
    const QByteArray residual = _normalizer.flush();
    if (!residual.isEmpty()) {
        _output.write(residual);
    }

    _resize->stop();
    _resize->setProcess(QString(), QSize());
    _exitCode = exitCode;

    qCInfo(lcTermweaveSession) << "process" << _processId << ExitStatus(exitCode).describe();
    setState(Exited);
    Q_EMIT exited(exitCode);
}

bool SessionBinding::sendInput(const QByteArray &data)
{
    if (_state != Bound || !_host) {
        qCDebug(lcTermweaveSession) << "dropping input, no process bound";
        return false;
    }
    _host->write(_processId, data);
    return true;
}

void SessionBinding::attachSurface(TerminalSurface *surface)
{
    if (_surface == surface) {
        return;
    }
    if (_surface) {
        detachSurface();
    }
    if (!surface) {
        return;
    }

    _surface = surface;

    connect(surface, &TerminalSurface::inputEntered, this, [this](const QByteArray &data) {
        _cursorGuard.anchor();
        sendInput(data);
    });
    connect(surface, &TerminalSurface::titleChanged, this, &SessionBinding::onSurfaceTitleChanged);
    connect(surface, &TerminalSurface::bellRang, _osc, &OscHandler::handleBell);
    connect(surface, &TerminalSurface::oscReceived, _osc, &OscHandler::handle);
    connect(surface, &TerminalSurface::focusGained, this, &SessionBinding::focused);
    connect(surface, &TerminalSurface::compositionStarted, this, [this]() {
        _compositionGuard.lock();
    });
    connect(surface, &TerminalSurface::compositionEnded, this, [this]() {
        _compositionGuard.unlock();
    });
    connect(surface, &TerminalSurface::selectionDragStarted, this, &SessionBinding::onSelectionDragStarted);
    connect(surface, &TerminalSurface::selectionDragFinished, this, &SessionBinding::onSelectionDragFinished);
    connect(surface, &TerminalSurface::geometryChanged, this, &SessionBinding::onSurfaceGeometryChanged);
    connect(surface, &TerminalSurface::devicePixelRatioChanged, _renderer, &RendererController::refresh);
    connect(surface, &TerminalSurface::aboutToBeDestroyed, this, &SessionBinding::onSurfaceAboutToBeDestroyed);
    connect(surface, &QObject::destroyed, this, &SessionBinding::onSurfaceDestroyed);

    _cursorGuard.setSurface(surface);
    _compositionGuard.setSurface(surface);
    _resize->setSurface(surface);
    _renderer->setSurface(surface);
    updatePaused();
    _output.setSurface(surface);

    if (_active) {
        _resize->requestImmediate();
    }
}

void SessionBinding::detachSurface()
{
    if (!_surface) {
        return;
    }
    disconnect(_surface.data(), nullptr, this, nullptr);
    disconnect(_surface.data(), nullptr, _osc, nullptr);
    disconnect(_surface.data(), nullptr, _renderer, nullptr);
    releaseSurface();
}

void SessionBinding::onSurfaceAboutToBeDestroyed()
{
    qCDebug(lcTermweaveSession) << "surface going away, keeping process" << _processId;
    detachSurface();
}

void SessionBinding::onSurfaceDestroyed()
{
    // Only reached for a surface that did not announce its destruction
    qCDebug(lcTermweaveSession) << "surface destroyed, keeping process" << _processId;
    releaseSurface();
}

void SessionBinding::releaseSurface()
{
    _cursorGuard.setSurface(nullptr);
    _compositionGuard.setSurface(nullptr);
    _compositionGuard.unlock();
    _resize->stop();
    _resize->setSurface(nullptr);
    _renderer->setSurface(nullptr);
    _output.setSurface(nullptr);
    _surface = nullptr;
    _selecting = false;
    updatePaused();
}

void SessionBinding::setActive(bool active)
{
    if (_active == active) {
        return;
    }
    _active = active;
    _activity->setActive(active);
    _renderer->setActive(active);

    if (active) {
        _resize->scheduleImmediate(_settings.activationResizeDelayMs);
    } else {
        _resize->stop();
    }
}

void SessionBinding::setVisible(bool visible)
{
    if (_visible == visible) {
        return;
    }
    _visible = visible;
    updatePaused();
}

void SessionBinding::updatePaused()
{
    if (!_visible || _selecting) {
        _output.pause();
    } else {
        _output.resume();
    }
}

void SessionBinding::onSurfaceTitleChanged(const QString &title)
{
    if (_title == title) {
        return;
    }
    _title = title;
    _activity->recordTitleChange();
    Q_EMIT titleChanged(title);
}

void SessionBinding::onSelectionDragStarted()
{
    _selecting = true;
    updatePaused();
}

void SessionBinding::onSelectionDragFinished()
{
    _selecting = false;
    _output.flush();
    updatePaused();
}

void SessionBinding::onSurfaceGeometryChanged()
{
    if (_active) {
        _resize->requestDebounced();
    }
}

void SessionBinding::onPanelResizeStarted()
{
    if (_active) {
        _renderer->suspend();
    }
}

void SessionBinding::onPanelResizeCompleted()
{
    _renderer->resume();
    if (_active) {
        _resize->requestImmediate();
    }
}

} // namespace Termweave

#include "moc_SessionBinding.cpp"
