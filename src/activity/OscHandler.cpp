/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "activity/OscHandler.h"

#include <QLoggingCategory>
#include <QStringList>
#include <QUrl>

Q_DECLARE_LOGGING_CATEGORY(lcTermweaveActivity)

namespace Termweave
{

OscHandler::OscHandler(QObject *parent)
    : QObject(parent)
{
}

bool OscHandler::handle(int code, const QString &payload)
{
    switch (code) {
    case RxvtNotify:
        return handleRxvt(payload);
    case ConEmu:
        return handleConEmu(payload);
    case KittyNotify:
        return handleKitty(payload);
    case CurrentDirectory:
        return handleCurrentDirectory(payload);
    default:
        return false;
    }
}

void OscHandler::handleBell()
{
    Q_EMIT notificationRaised(QString(), QStringLiteral("Bell"));
}

// notify;title;body
bool OscHandler::handleRxvt(const QString &payload)
{
    const QStringList parts = payload.split(QLatin1Char(';'));
    if (parts.size() < 3 || parts.at(0) != QLatin1String("notify")) {
        qCDebug(lcTermweaveActivity) << "ignoring OSC 777 payload" << payload;
        return false;
    }
    const QString title = parts.at(1);
    const QString body = parts.mid(2).join(QLatin1Char(';'));
    Q_EMIT notificationRaised(title, body);
    return true;
}

// 4;state[;progress] is a progress report, anything else a notification
bool OscHandler::handleConEmu(const QString &payload)
{
    const QStringList parts = payload.split(QLatin1Char(';'));
    if (parts.at(0) == QLatin1String("4")) {
        if (parts.size() < 2) {
            return false;
        }
        bool ok = false;
        const int state = parts.at(1).toInt(&ok);
        if (!ok) {
            qCDebug(lcTermweaveActivity) << "ignoring non-numeric progress state" << parts.at(1);
            return false;
        }
        int progress = 0;
        if (parts.size() > 2) {
            progress = parts.at(2).toInt(&ok);
            if (!ok) {
                progress = 0;
            }
        }
        Q_EMIT progressReported(state, progress);
        return true;
    }

    if (payload.isEmpty()) {
        return false;
    }
    Q_EMIT notificationRaised(QString(), payload);
    return true;
}

bool OscHandler::handleKitty(const QString &payload)
{
    const int separator = payload.indexOf(QLatin1Char(';'));
    const QString body = separator < 0 ? payload : payload.mid(separator + 1);
    if (body.isEmpty()) {
        return false;
    }
    Q_EMIT notificationRaised(QString(), body);
    return true;
}

bool OscHandler::handleCurrentDirectory(const QString &payload)
{
    const QUrl url(payload);
    if (!url.isValid() || url.scheme() != QLatin1String("file")) {
        qCDebug(lcTermweaveActivity) << "ignoring OSC 7 payload" << payload;
        return false;
    }
    const QString path = url.path(QUrl::FullyDecoded);
    if (path.isEmpty()) {
        return false;
    }
    Q_EMIT cwdChanged(path);
    return true;
}

} // namespace Termweave

#include "moc_OscHandler.cpp"
