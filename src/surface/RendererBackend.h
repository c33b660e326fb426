/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RENDERERBACKEND_H
#define RENDERERBACKEND_H

#include <QObject>

#include "termweaveprivate_export.h"

namespace Termweave
{

/**
 * GPU accelerated rendering backend attached to a TerminalSurface.
 *
 * The backend is attached to its surface for as long as the object
 * lives; destroying it returns the surface to software rendering. It is
 * always destroyed before the surface it was created by.
 */
class TERMWEAVEPRIVATE_EXPORT RendererBackend : public QObject
{
    Q_OBJECT
public:
    explicit RendererBackend(QObject *parent = nullptr);
    ~RendererBackend() override;

    /** Drops cached glyphs so they are rasterized again at the current pixel ratio. */
    virtual void clearTextureAtlas() = 0;

Q_SIGNALS:
    /** The GPU context backing this renderer is gone. The backend is unusable afterwards. */
    void contextLost();
};

} // namespace Termweave

#endif // RENDERERBACKEND_H
