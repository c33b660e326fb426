/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "surface/RendererBackend.h"

namespace Termweave
{

RendererBackend::RendererBackend(QObject *parent)
    : QObject(parent)
{
}

RendererBackend::~RendererBackend() = default;

} // namespace Termweave

#include "moc_RendererBackend.cpp"
