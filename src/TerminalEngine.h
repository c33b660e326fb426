/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALENGINE_H
#define TERMINALENGINE_H

#include <QList>
#include <QObject>
#include <QPointer>

#include "EngineSettings.h"
#include "termweaveprivate_export.h"

namespace Termweave
{

class PanelResizeBus;
class ProcessHost;
class RendererContextArbiter;
class SessionBinding;
class TerminalSurface;
struct SpawnTarget;

/**
 * Owns everything the sessions of one window share: the host process
 * channel, the settings, the panel resize bus and the GPU context.
 *
 * Bindings are children of the engine. A binding that is closed removes
 * itself from the engine and is deleted later.
 */
class TERMWEAVEPRIVATE_EXPORT TerminalEngine : public QObject
{
    Q_OBJECT
public:
    TerminalEngine(ProcessHost *host, const EngineSettings &settings = EngineSettings(), QObject *parent = nullptr);
    ~TerminalEngine() override;

    ProcessHost *processHost() const;
    const EngineSettings &settings() const
    {
        return _settings;
    }

    PanelResizeBus *panelResizeBus() const
    {
        return _panelResizeBus;
    }
    RendererContextArbiter *rendererArbiter() const
    {
        return _rendererArbiter;
    }

    /**
     * Creates a binding for target shown in surface. The process is not
     * started until SessionBinding::spawn() is called.
     */
    SessionBinding *createBinding(TerminalSurface *surface, const SpawnTarget &target);

    QList<SessionBinding *> bindings() const;
    SessionBinding *bindingForProcess(const QString &processId) const;

    void registerBinding(SessionBinding *binding);
    void unregisterBinding(SessionBinding *binding);

    void beginPanelResize();
    void endPanelResize();

Q_SIGNALS:
    void bindingAdded(SessionBinding *binding);
    void bindingRemoved(SessionBinding *binding);

private:
    QPointer<ProcessHost> _host;
    EngineSettings _settings;
    PanelResizeBus *_panelResizeBus;
    RendererContextArbiter *_rendererArbiter;

    QList<SessionBinding *> _bindings;
};

} // namespace Termweave

#endif // TERMINALENGINE_H
