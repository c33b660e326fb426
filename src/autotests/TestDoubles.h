/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TESTDOUBLES_H
#define TESTDOUBLES_H

#include <QByteArray>
#include <QList>
#include <QPointer>
#include <QSize>
#include <QString>
#include <QStringList>

#include <memory>

#include "../session/ProcessHost.h"
#include "../surface/RendererBackend.h"
#include "../surface/TerminalSurface.h"

namespace Termweave
{

/**
 * Records every call; spawns stay pending until the test resolves them.
 */
class FakeProcessHost : public ProcessHost
{
    Q_OBJECT
public:
    struct SpawnRequest {
        SpawnTarget target;
        int columns = 0;
        int lines = 0;
        SpawnCallback callback;
    };

    struct Write {
        QString processId;
        QByteArray data;
    };

    struct Resize {
        QString processId;
        int columns = 0;
        int lines = 0;
    };

    explicit FakeProcessHost(QObject *parent = nullptr);

    void spawn(const SpawnTarget &target, int columns, int lines, SpawnCallback callback) override;
    void write(const QString &processId, const QByteArray &data) override;
    void resize(const QString &processId, int columns, int lines) override;
    void kill(const QString &processId) override;

    // Completes spawn request `index`
    void resolveSpawn(int index, const QString &processId);
    void failSpawn(int index, const QString &error);

    void emitOutput(const QString &processId, const QByteArray &data);
    void emitExit(const QString &processId, int exitCode);

    QList<SpawnRequest> spawnRequests;
    QList<Write> writes;
    QList<Resize> resizes;
    QStringList kills;
};

class FakeRendererBackend : public RendererBackend
{
    Q_OBJECT
public:
    explicit FakeRendererBackend(QObject *parent = nullptr);
    ~FakeRendererBackend() override;

    void clearTextureAtlas() override;

    void loseContext();

    int atlasClears = 0;

    // Cleared by the creating surface once its destructor has run
    std::shared_ptr<bool> surfaceAlive;

    // Backends destroyed after the surface that created them
    static int destroyedAfterSurface;
};

class FakeTerminalSurface : public TerminalSurface
{
    Q_OBJECT
public:
    explicit FakeTerminalSurface(QObject *parent = nullptr);
    ~FakeTerminalSurface() override;

    void write(const QByteArray &data) override;
    void clear() override;

    int columns() const override;
    int lines() const override;
    QSize proposeDimensions() const override;
    void applyDimensions(int columns, int lines) override;

    int cursorLine() const override;
    int viewportTopLine() const override;
    void scrollToCursor() override;
    void setCursorPinned(bool pinned) override;
    void repaint() override;

    std::unique_ptr<RendererBackend> createAcceleratedRenderer() override;

    // Simulates the view being laid out at a new pixel size
    void setProposedDimensions(int columns, int lines);

    QByteArray written;
    int writeCount = 0;
    int clearCount = 0;
    int applyCount = 0;
    int scrollCount = 0;
    int repaintCount = 0;
    int rendererCreateCount = 0;
    bool cursorPinned = false;
    bool failRenderer = false;
    QPointer<FakeRendererBackend> renderer;
    std::shared_ptr<bool> alive = std::make_shared<bool>(true);

    int gridColumns = 80;
    int gridLines = 24;
    QSize proposed = QSize(80, 24);
    int cursor = 0;
    int viewportTop = 0;
};

} // namespace Termweave

#endif // TESTDOUBLES_H
