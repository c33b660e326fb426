/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PanelResizeBus.h"

namespace Termweave
{

PanelResizeBus::PanelResizeBus(QObject *parent)
    : QObject(parent)
{
}

void PanelResizeBus::publishStarted()
{
    if (_resizing) {
        return;
    }
    _resizing = true;
    Q_EMIT resizeStarted();
}

void PanelResizeBus::publishCompleted()
{
    // Delivered even without a matching start
    _resizing = false;
    Q_EMIT resizeCompleted();
}

} // namespace Termweave

#include "moc_PanelResizeBus.cpp"
