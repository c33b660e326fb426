/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "renderer/RendererController.h"

#include "renderer/RendererContextArbiter.h"
#include "surface/RendererBackend.h"
#include "surface/TerminalSurface.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcTermweaveRenderer, "termweave.renderer", QtInfoMsg)

namespace Termweave
{

RendererController::RendererController(RendererContextArbiter *arbiter, const EngineSettings &settings, QObject *parent)
    : QObject(parent)
    , _arbiter(arbiter)
    , _mode(settings.rendererMode)
    , _maxRecoveryAttempts(settings.rendererMaxRecoveryAttempts)
{
    _recoveryTimer.setSingleShot(true);
    _recoveryTimer.setInterval(settings.rendererRecoveryDelayMs);
    connect(&_recoveryTimer, &QTimer::timeout, this, &RendererController::evaluate);
}

RendererController::~RendererController()
{
    dispose();
}

void RendererController::setSurface(TerminalSurface *surface)
{
    // A destroyed surface already reads as null; still drop its backend
    if (_surface == surface && surface) {
        return;
    }
    unload();
    _surface = surface;
    evaluate();
}

void RendererController::setMode(RendererMode mode)
{
    if (_mode == mode) {
        return;
    }
    _mode = mode;
    _recoveryAttempts = 0;
    evaluate();
}

void RendererController::setActive(bool active)
{
    if (_active == active) {
        return;
    }
    _active = active;
    if (active) {
        _recoveryAttempts = 0;
    }
    evaluate();
}

void RendererController::suspend()
{
    if (_suspended) {
        return;
    }
    _suspended = true;
    _recoveryTimer.stop();
    unload();
}

void RendererController::resume()
{
    if (!_suspended) {
        return;
    }
    _suspended = false;
    evaluate();
    if (_surface) {
        _surface->repaint();
    }
}

void RendererController::refresh()
{
    if (_backend) {
        _backend->clearTextureAtlas();
    } else {
        evaluate();
    }
    if (_surface) {
        _surface->repaint();
    }
}

void RendererController::dispose()
{
    _disposed = true;
    _recoveryTimer.stop();
    unload();
}

void RendererController::releaseContext()
{
    if (_backend) {
        qCDebug(lcTermweaveRenderer) << "GPU context taken by another session, using software rendering";
    }
    unload();
}

bool RendererController::shouldLoad() const
{
    if (_disposed || _suspended || !_surface) {
        return false;
    }
    switch (_mode) {
    case RendererMode::Off:
        return false;
    case RendererMode::Auto:
        return _active;
    case RendererMode::On:
        return true;
    }
    return false;
}

void RendererController::evaluate()
{
    if (shouldLoad()) {
        if (!_backend) {
            load();
        }
    } else {
        unload();
    }
}

void RendererController::load()
{
    if (_arbiter) {
        _arbiter->acquire(this);
    }

    _backend = _surface->createAcceleratedRenderer();
    if (!_backend) {
        qCWarning(lcTermweaveRenderer) << "accelerated renderer failed to load, using software rendering";
        if (_arbiter) {
            _arbiter->release(this);
        }
        return;
    }

    connect(_backend.get(), &RendererBackend::contextLost, this, &RendererController::onContextLost);
    qCDebug(lcTermweaveRenderer) << "accelerated renderer loaded";
    Q_EMIT loadedChanged(true);
}

void RendererController::unload()
{
    if (!_backend) {
        return;
    }
    _backend.reset();
    if (_arbiter) {
        _arbiter->release(this);
    }
    Q_EMIT loadedChanged(false);
}

void RendererController::onContextLost()
{
    if (!_backend) {
        return;
    }

    qCWarning(lcTermweaveRenderer) << "GPU context lost, falling back to software rendering";

    // We are inside the backend's own signal; delete it later
    RendererBackend *lost = _backend.release();
    disconnect(lost, nullptr, this, nullptr);
    lost->deleteLater();
    if (_arbiter) {
        _arbiter->release(this);
    }
    Q_EMIT loadedChanged(false);

    if (_surface) {
        _surface->repaint();
    }

    if (_recoveryAttempts < _maxRecoveryAttempts && shouldLoad()) {
        _recoveryAttempts++;
        qCInfo(lcTermweaveRenderer) << "reloading accelerated renderer in" << _recoveryTimer.interval() << "ms, attempt" << _recoveryAttempts;
        _recoveryTimer.start();
    }
}

} // namespace Termweave

#include "moc_RendererController.cpp"
