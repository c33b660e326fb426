/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "EngineSettings.h"

#include <QLoggingCategory>
#include <QSettings>

Q_DECLARE_LOGGING_CATEGORY(lcTermweaveEngine)

namespace Termweave
{

namespace
{

void readInt(QSettings &settings, const QString &key, int minimum, int &value)
{
    if (!settings.contains(key)) {
        return;
    }
    bool ok = false;
    int parsed = settings.value(key).toInt(&ok);
    if (!ok || parsed < minimum) {
        qCWarning(lcTermweaveEngine) << "Ignoring invalid setting" << key << "=" << settings.value(key);
        return;
    }
    value = parsed;
}

}

std::optional<RendererMode> rendererModeFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("off")) {
        return RendererMode::Off;
    } else if (normalized == QLatin1String("auto")) {
        return RendererMode::Auto;
    } else if (normalized == QLatin1String("on")) {
        return RendererMode::On;
    }
    return std::nullopt;
}

QString rendererModeToString(RendererMode mode)
{
    switch (mode) {
    case RendererMode::Off:
        return QStringLiteral("off");
    case RendererMode::Auto:
        return QStringLiteral("auto");
    case RendererMode::On:
        return QStringLiteral("on");
    }
    return QStringLiteral("auto");
}

EngineSettings EngineSettings::load(QSettings &settings)
{
    EngineSettings result;

    settings.beginGroup(QStringLiteral("Terminal"));
    readInt(settings, QStringLiteral("ActivityTimeout"), 1, result.activityTimeoutMs);
    readInt(settings, QStringLiteral("ActivityGracePeriod"), 0, result.activityGraceMs);
    readInt(settings, QStringLiteral("ActivityGraceThreshold"), 0, result.activityGraceThreshold);
    readInt(settings, QStringLiteral("ResizeDebounce"), 0, result.resizeDebounceMs);
    readInt(settings, QStringLiteral("ActivationResizeDelay"), 0, result.activationResizeDelayMs);
    readInt(settings, QStringLiteral("CursorScrollInterval"), 0, result.cursorScrollIntervalMs);
    readInt(settings, QStringLiteral("CursorRowTolerance"), 0, result.cursorRowTolerance);
    readInt(settings, QStringLiteral("CursorAnchorWindow"), 0, result.cursorAnchorWindowMs);
    readInt(settings, QStringLiteral("RendererRecoveryDelay"), 0, result.rendererRecoveryDelayMs);
    readInt(settings, QStringLiteral("RendererMaxRecoveryAttempts"), 0, result.rendererMaxRecoveryAttempts);

    if (settings.contains(QStringLiteral("RendererMode"))) {
        const QString modeString = settings.value(QStringLiteral("RendererMode")).toString();
        auto mode = rendererModeFromString(modeString);
        if (mode.has_value()) {
            result.rendererMode = mode.value();
        } else {
            qCWarning(lcTermweaveEngine) << "Unknown renderer mode" << modeString << "- keeping" << rendererModeToString(result.rendererMode);
        }
    }
    if (settings.contains(QStringLiteral("SingleRendererContext"))) {
        result.singleRendererContext = settings.value(QStringLiteral("SingleRendererContext")).toBool();
    }
    settings.endGroup();

    return result;
}

void EngineSettings::save(QSettings &settings) const
{
    settings.beginGroup(QStringLiteral("Terminal"));
    settings.setValue(QStringLiteral("ActivityTimeout"), activityTimeoutMs);
    settings.setValue(QStringLiteral("ActivityGracePeriod"), activityGraceMs);
    settings.setValue(QStringLiteral("ActivityGraceThreshold"), activityGraceThreshold);
    settings.setValue(QStringLiteral("ResizeDebounce"), resizeDebounceMs);
    settings.setValue(QStringLiteral("ActivationResizeDelay"), activationResizeDelayMs);
    settings.setValue(QStringLiteral("CursorScrollInterval"), cursorScrollIntervalMs);
    settings.setValue(QStringLiteral("CursorRowTolerance"), cursorRowTolerance);
    settings.setValue(QStringLiteral("CursorAnchorWindow"), cursorAnchorWindowMs);
    settings.setValue(QStringLiteral("RendererMode"), rendererModeToString(rendererMode));
    settings.setValue(QStringLiteral("RendererRecoveryDelay"), rendererRecoveryDelayMs);
    settings.setValue(QStringLiteral("RendererMaxRecoveryAttempts"), rendererMaxRecoveryAttempts);
    settings.setValue(QStringLiteral("SingleRendererContext"), singleRendererContext);
    settings.endGroup();
}

} // namespace Termweave
