/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "session/ProcessHost.h"

namespace Termweave
{

QString spawnTargetKindName(SpawnTarget::Kind kind)
{
    switch (kind) {
    case SpawnTarget::Kind::Main:
        return QStringLiteral("main");
    case SpawnTarget::Kind::Shell:
        return QStringLiteral("shell");
    case SpawnTarget::Kind::Project:
        return QStringLiteral("project");
    case SpawnTarget::Kind::Scratch:
        return QStringLiteral("scratch");
    }
    return QString();
}

ProcessHost::ProcessHost(QObject *parent)
    : QObject(parent)
{
}

ProcessHost::~ProcessHost() = default;

} // namespace Termweave

#include "moc_ProcessHost.cpp"
