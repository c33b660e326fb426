/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PANELRESIZEBUS_H
#define PANELRESIZEBUS_H

#include <QObject>

#include "termweaveprivate_export.h"

namespace Termweave
{

/**
 * Broadcasts the start and end of an interactive panel resize (splitter
 * drag) to every session of an engine.
 */
class TERMWEAVEPRIVATE_EXPORT PanelResizeBus : public QObject
{
    Q_OBJECT
public:
    explicit PanelResizeBus(QObject *parent = nullptr);

    void publishStarted();
    void publishCompleted();

    bool isResizing() const
    {
        return _resizing;
    }

Q_SIGNALS:
    void resizeStarted();
    void resizeCompleted();

private:
    bool _resizing = false;
};

} // namespace Termweave

#endif // PANELRESIZEBUS_H
