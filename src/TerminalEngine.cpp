/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalEngine.h"

#include "PanelResizeBus.h"
#include "renderer/RendererContextArbiter.h"
#include "session/ProcessHost.h"
#include "session/SessionBinding.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcTermweaveEngine, "termweave.engine", QtInfoMsg)

namespace Termweave
{

TerminalEngine::TerminalEngine(ProcessHost *host, const EngineSettings &settings, QObject *parent)
    : QObject(parent)
    , _host(host)
    , _settings(settings)
    , _panelResizeBus(new PanelResizeBus(this))
    , _rendererArbiter(new RendererContextArbiter(settings.singleRendererContext, this))
{
}

TerminalEngine::~TerminalEngine()
{
    // Bindings go first, they still talk to the bus and the arbiter
    // while tearing down.
    const QList<SessionBinding *> bindings = _bindings;
    _bindings.clear();
    qDeleteAll(bindings);
}

ProcessHost *TerminalEngine::processHost() const
{
    return _host.data();
}

SessionBinding *TerminalEngine::createBinding(TerminalSurface *surface, const SpawnTarget &target)
{
    auto *binding = new SessionBinding(this, target, this);
    connect(binding, &SessionBinding::closed, binding, &QObject::deleteLater);
    if (surface) {
        binding->attachSurface(surface);
    }
    return binding;
}

QList<SessionBinding *> TerminalEngine::bindings() const
{
    return _bindings;
}

SessionBinding *TerminalEngine::bindingForProcess(const QString &processId) const
{
    if (processId.isEmpty()) {
        return nullptr;
    }
    for (SessionBinding *binding : _bindings) {
        if (binding->processId() == processId) {
            return binding;
        }
    }
    return nullptr;
}

void TerminalEngine::registerBinding(SessionBinding *binding)
{
    if (!_bindings.contains(binding)) {
        _bindings.append(binding);
        qCDebug(lcTermweaveEngine) << "binding added," << _bindings.size() << "live";
        Q_EMIT bindingAdded(binding);
    }
}

void TerminalEngine::unregisterBinding(SessionBinding *binding)
{
    if (_bindings.removeOne(binding)) {
        qCDebug(lcTermweaveEngine) << "binding removed," << _bindings.size() << "live";
        Q_EMIT bindingRemoved(binding);
    }
}

void TerminalEngine::beginPanelResize()
{
    _panelResizeBus->publishStarted();
}

void TerminalEngine::endPanelResize()
{
    _panelResizeBus->publishCompleted();
}

} // namespace Termweave

#include "moc_TerminalEngine.cpp"
