/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "renderer/RendererContextArbiter.h"

#include "renderer/RendererController.h"

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTermweaveRenderer)

namespace Termweave
{

RendererContextArbiter::RendererContextArbiter(bool exclusive, QObject *parent)
    : QObject(parent)
    , _exclusive(exclusive)
{
}

void RendererContextArbiter::setExclusive(bool exclusive)
{
    _exclusive = exclusive;
    if (!_exclusive) {
        _holder = nullptr;
    }
}

void RendererContextArbiter::acquire(RendererController *controller)
{
    if (!_exclusive || _holder == controller) {
        return;
    }

    QPointer<RendererController> previous = _holder;
    _holder = controller;
    if (previous) {
        qCDebug(lcTermweaveRenderer) << "pre-empting GPU context of" << previous.data();
        previous->releaseContext();
    }
    Q_EMIT holderChanged(controller);
}

RendererController *RendererContextArbiter::holder() const
{
    return _holder.data();
}

void RendererContextArbiter::release(RendererController *controller)
{
    if (!_exclusive || _holder != controller) {
        return;
    }
    _holder = nullptr;
    Q_EMIT holderChanged(nullptr);
}

} // namespace Termweave

#include "moc_RendererContextArbiter.cpp"
