/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOSTEVENT_H
#define HOSTEVENT_H

#include <QByteArray>
#include <QString>

#include <variant>

namespace Termweave
{

struct HostOutputEvent {
    QString processId;
    QByteArray data;
};

struct HostExitEvent {
    QString processId;
    int exitCode;
};

using HostEvent = std::variant<HostOutputEvent, HostExitEvent>;

inline const QString &hostEventProcessId(const HostEvent &event)
{
    return std::visit(
        [](const auto &e) -> const QString & {
            return e.processId;
        },
        event);
}

} // namespace Termweave

#endif // HOSTEVENT_H
