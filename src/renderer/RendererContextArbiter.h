/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RENDERERCONTEXTARBITER_H
#define RENDERERCONTEXTARBITER_H

#include <QObject>
#include <QPointer>

#include "termweaveprivate_export.h"

namespace Termweave
{

class RendererController;

/**
 * Hands out the GPU rendering context.
 *
 * In exclusive mode at most one controller holds the context; a new
 * request pre-empts the current holder, which drops back to software
 * rendering. In shared mode every request is granted.
 */
class TERMWEAVEPRIVATE_EXPORT RendererContextArbiter : public QObject
{
    Q_OBJECT
public:
    explicit RendererContextArbiter(bool exclusive, QObject *parent = nullptr);

    void setExclusive(bool exclusive);
    bool isExclusive() const
    {
        return _exclusive;
    }

    void acquire(RendererController *controller);
    void release(RendererController *controller);

    RendererController *holder() const;

Q_SIGNALS:
    void holderChanged(RendererController *holder);

private:
    bool _exclusive;
    QPointer<RendererController> _holder;
};

} // namespace Termweave

#endif // RENDERERCONTEXTARBITER_H
