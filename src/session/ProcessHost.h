/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PROCESSHOST_H
#define PROCESSHOST_H

#include <QByteArray>
#include <QObject>
#include <QString>

#include <functional>

#include "termweaveprivate_export.h"

namespace Termweave
{

struct SpawnTarget {
    enum class Kind {
        Main, // the workspace's configured main command
        Shell,
        Project,
        Scratch,
    };

    Kind kind = Kind::Shell;
    QString entityId;
    QString directory; // empty = host default
};

TERMWEAVEPRIVATE_EXPORT QString spawnTargetKindName(SpawnTarget::Kind kind);

/**
 * The external host-process manager.
 *
 * Processes are addressed by an opaque id handed out by spawn().
 * Output and exit events for every process arrive on the same two
 * signals; receivers filter by their own id.
 */
class TERMWEAVEPRIVATE_EXPORT ProcessHost : public QObject
{
    Q_OBJECT
public:
    explicit ProcessHost(QObject *parent = nullptr);
    ~ProcessHost() override;

    /** On failure processId is empty and error describes the problem. */
    using SpawnCallback = std::function<void(bool success, const QString &processId, const QString &error)>;

    virtual void spawn(const SpawnTarget &target, int columns, int lines, SpawnCallback callback) = 0;
    virtual void write(const QString &processId, const QByteArray &data) = 0;
    virtual void resize(const QString &processId, int columns, int lines) = 0;
    virtual void kill(const QString &processId) = 0;

Q_SIGNALS:
    void outputReceived(const QString &processId, const QByteArray &data);
    void processExited(const QString &processId, int exitCode);
};

} // namespace Termweave

#endif // PROCESSHOST_H
