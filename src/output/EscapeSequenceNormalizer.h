/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ESCAPESEQUENCENORMALIZER_H
#define ESCAPESEQUENCENORMALIZER_H

#include <QByteArray>

#include "termweaveprivate_export.h"

namespace Termweave
{

/**
 * Rewrites colon separated direct colors without a colorspace field
 * ("38:2:R:G:B", "48:2:R:G:B", as sent by e.g. Neovim) into the form
 * with an empty colorspace ("38:2::R:G:B") that the surface parses.
 *
 * Process output arrives in arbitrary chunks, so a sequence may be split
 * between two calls to normalize(). A suffix that may still turn into a
 * match is held back until the next chunk decides it. Each number is at
 * most MaxNumberDigits long, which bounds how much is held back.
 */
class TERMWEAVEPRIVATE_EXPORT EscapeSequenceNormalizer
{
public:
    static constexpr int MaxNumberDigits = 10;

    QByteArray normalize(const QByteArray &chunk);

    /** Returns the held back bytes unchanged and resets the state. */
    QByteArray flush();

    bool hasResidual() const
    {
        return !_residual.isEmpty();
    }

private:
    enum class MatchResult { NoMatch, Match, Incomplete };

    static MatchResult matchAt(const QByteArray &data, int pos, int &length);

    QByteArray _residual;
};

} // namespace Termweave

#endif // ESCAPESEQUENCENORMALIZER_H
