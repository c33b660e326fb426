/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef EXITSTATUS_H
#define EXITSTATUS_H

#include <QString>

#include "termweaveprivate_export.h"

namespace Termweave
{

/**
 * Display classification of a process exit code. Exit codes are never
 * used to decide on retries.
 */
class TERMWEAVEPRIVATE_EXPORT ExitStatus
{
public:
    enum class Kind { Success, Error, Signaled, Unknown };

    explicit ExitStatus(int exitCode)
        : _exitCode(exitCode)
    {
    }

    int exitCode() const
    {
        return _exitCode;
    }

    Kind kind() const;

    /** Signal number for Signaled exits (code - 128), otherwise 0. */
    int signalNumber() const;

    QString describe() const;

private:
    int _exitCode;
};

} // namespace Termweave

#endif // EXITSTATUS_H
