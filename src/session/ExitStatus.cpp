/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "session/ExitStatus.h"

namespace Termweave
{

ExitStatus::Kind ExitStatus::kind() const
{
    if (_exitCode < 0) {
        return Kind::Unknown;
    } else if (_exitCode == 0) {
        return Kind::Success;
    } else if (_exitCode < 128) {
        return Kind::Error;
    }
    return Kind::Signaled;
}

int ExitStatus::signalNumber() const
{
    return kind() == Kind::Signaled ? _exitCode - 128 : 0;
}

QString ExitStatus::describe() const
{
    switch (kind()) {
    case Kind::Success:
        return QStringLiteral("exited successfully");
    case Kind::Error:
        return QStringLiteral("exited with code %1").arg(_exitCode);
    case Kind::Signaled:
        return QStringLiteral("terminated by signal %1").arg(signalNumber());
    case Kind::Unknown:
        break;
    }
    return QStringLiteral("exited");
}

} // namespace Termweave
