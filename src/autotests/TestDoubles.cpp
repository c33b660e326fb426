/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TestDoubles.h"

#include <memory>
#include <utility>

namespace Termweave
{

FakeProcessHost::FakeProcessHost(QObject *parent)
    : ProcessHost(parent)
{
}

void FakeProcessHost::spawn(const SpawnTarget &target, int columns, int lines, SpawnCallback callback)
{
    spawnRequests.append({target, columns, lines, std::move(callback)});
}

void FakeProcessHost::write(const QString &processId, const QByteArray &data)
{
    writes.append({processId, data});
}

void FakeProcessHost::resize(const QString &processId, int columns, int lines)
{
    resizes.append({processId, columns, lines});
}

void FakeProcessHost::kill(const QString &processId)
{
    kills.append(processId);
}

void FakeProcessHost::resolveSpawn(int index, const QString &processId)
{
    // The callback may spawn again and grow the list
    const SpawnCallback callback = spawnRequests.at(index).callback;
    callback(true, processId, QString());
}

void FakeProcessHost::failSpawn(int index, const QString &error)
{
    const SpawnCallback callback = spawnRequests.at(index).callback;
    callback(false, QString(), error);
}

void FakeProcessHost::emitOutput(const QString &processId, const QByteArray &data)
{
    Q_EMIT outputReceived(processId, data);
}

void FakeProcessHost::emitExit(const QString &processId, int exitCode)
{
    Q_EMIT processExited(processId, exitCode);
}

int FakeRendererBackend::destroyedAfterSurface = 0;

FakeRendererBackend::FakeRendererBackend(QObject *parent)
    : RendererBackend(parent)
{
}

FakeRendererBackend::~FakeRendererBackend()
{
    if (surfaceAlive && !*surfaceAlive) {
        destroyedAfterSurface++;
    }
}

void FakeRendererBackend::clearTextureAtlas()
{
    atlasClears++;
}

void FakeRendererBackend::loseContext()
{
    Q_EMIT contextLost();
}

FakeTerminalSurface::FakeTerminalSurface(QObject *parent)
    : TerminalSurface(parent)
{
}

FakeTerminalSurface::~FakeTerminalSurface()
{
    Q_EMIT aboutToBeDestroyed();
    *alive = false;
}

void FakeTerminalSurface::write(const QByteArray &data)
{
    written.append(data);
    writeCount++;
}

void FakeTerminalSurface::clear()
{
    written.clear();
    clearCount++;
}

int FakeTerminalSurface::columns() const
{
    return gridColumns;
}

int FakeTerminalSurface::lines() const
{
    return gridLines;
}

QSize FakeTerminalSurface::proposeDimensions() const
{
    return proposed;
}

void FakeTerminalSurface::applyDimensions(int columns, int lines)
{
    gridColumns = columns;
    gridLines = lines;
    applyCount++;
}

int FakeTerminalSurface::cursorLine() const
{
    return cursor;
}

int FakeTerminalSurface::viewportTopLine() const
{
    return viewportTop;
}

void FakeTerminalSurface::scrollToCursor()
{
    viewportTop = qMax(0, cursor - gridLines + 1);
    scrollCount++;
}

void FakeTerminalSurface::setCursorPinned(bool pinned)
{
    cursorPinned = pinned;
}

void FakeTerminalSurface::repaint()
{
    repaintCount++;
}

std::unique_ptr<RendererBackend> FakeTerminalSurface::createAcceleratedRenderer()
{
    rendererCreateCount++;
    if (failRenderer) {
        return nullptr;
    }
    auto backend = std::make_unique<FakeRendererBackend>();
    backend->surfaceAlive = alive;
    renderer = backend.get();
    return backend;
}

void FakeTerminalSurface::setProposedDimensions(int columns, int lines)
{
    proposed = QSize(columns, lines);
}

} // namespace Termweave

#include "moc_TestDoubles.cpp"
