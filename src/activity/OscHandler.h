/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef OSCHANDLER_H
#define OSCHANDLER_H

#include <QObject>
#include <QString>

#include "termweaveprivate_export.h"

namespace Termweave
{

/**
 * Interprets the operating system commands a surface hands over
 * (notifications, progress and working directory) and the bell.
 */
class TERMWEAVEPRIVATE_EXPORT OscHandler : public QObject
{
    Q_OBJECT
public:
    enum Code {
        CurrentDirectory = 7,
        ConEmu = 9,
        KittyNotify = 99,
        RxvtNotify = 777,
    };

    explicit OscHandler(QObject *parent = nullptr);

    /** Returns false when the code or payload is not one we understand. */
    bool handle(int code, const QString &payload);
    void handleBell();

Q_SIGNALS:
    void notificationRaised(const QString &title, const QString &body);
    void progressReported(int state, int progress);
    void cwdChanged(const QString &path);

private:
    bool handleRxvt(const QString &payload);
    bool handleConEmu(const QString &payload);
    bool handleKitty(const QString &payload);
    bool handleCurrentDirectory(const QString &payload);
};

} // namespace Termweave

#endif // OSCHANDLER_H
