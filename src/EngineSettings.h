/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ENGINESETTINGS_H
#define ENGINESETTINGS_H

#include <QString>

#include <optional>

#include "termweaveprivate_export.h"

class QSettings;

namespace Termweave
{

enum class RendererMode { Off, Auto, On };

TERMWEAVEPRIVATE_EXPORT std::optional<RendererMode> rendererModeFromString(const QString &value);
TERMWEAVEPRIVATE_EXPORT QString rendererModeToString(RendererMode mode);

/**
 * Tunable thresholds of the terminal engine.
 *
 * The values are tuned against the event delivery granularity of the
 * host platform; they are configuration, not protocol constants.
 */
struct TERMWEAVEPRIVATE_EXPORT EngineSettings {
    // Activity detection for background sessions
    int activityTimeoutMs = 250;
    int activityGraceMs = 100;
    int activityGraceThreshold = 2;

    // Resize coordination
    int resizeDebounceMs = 150;
    int activationResizeDelayMs = 50;

    // Cursor visibility guard
    int cursorScrollIntervalMs = 50;
    int cursorRowTolerance = 1;
    int cursorAnchorWindowMs = 500;

    // Accelerated renderer
    RendererMode rendererMode = RendererMode::Auto;
    int rendererRecoveryDelayMs = 1000;
    int rendererMaxRecoveryAttempts = 3;
    bool singleRendererContext = true;

    /** Reads the "Terminal" group, keeping defaults for missing or invalid keys. */
    static EngineSettings load(QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace Termweave

#endif // ENGINESETTINGS_H
