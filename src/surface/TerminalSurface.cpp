/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "surface/TerminalSurface.h"

#include "surface/RendererBackend.h"

namespace Termweave
{

TerminalSurface::TerminalSurface(QObject *parent)
    : QObject(parent)
{
}

TerminalSurface::~TerminalSurface() = default;

} // namespace Termweave

#include "moc_TerminalSurface.cpp"
