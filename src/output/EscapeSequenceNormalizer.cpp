/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "output/EscapeSequenceNormalizer.h"

#include <initializer_list>

namespace Termweave
{

namespace
{

inline bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

}

QByteArray EscapeSequenceNormalizer::normalize(const QByteArray &chunk)
{
    QByteArray input = _residual + chunk;
    _residual.clear();

    QByteArray output;
    output.reserve(input.size() + 8);

    int pos = 0;
    int copyFrom = 0;
    while (pos < input.size()) {
        const char c = input[pos];
        if (c != '3' && c != '4') {
            pos++;
            continue;
        }

        int length = 0;
        switch (matchAt(input, pos, length)) {
        case MatchResult::NoMatch:
            pos++;
            break;
        case MatchResult::Match:
            // "38:2" + ":" + ":R:G:B"
            output.append(input.constData() + copyFrom, pos - copyFrom);
            output.append(input.constData() + pos, 4);
            output.append(':');
            output.append(input.constData() + pos + 4, length - 4);
            pos += length;
            copyFrom = pos;
            break;
        case MatchResult::Incomplete:
            output.append(input.constData() + copyFrom, pos - copyFrom);
            _residual = input.mid(pos);
            return output;
        }
    }

    output.append(input.constData() + copyFrom, input.size() - copyFrom);
    return output;
}

QByteArray EscapeSequenceNormalizer::flush()
{
    QByteArray residual = _residual;
    _residual.clear();
    return residual;
}

EscapeSequenceNormalizer::MatchResult EscapeSequenceNormalizer::matchAt(const QByteArray &data, int pos, int &length)
{
    const int size = data.size();

    // Selector: "38:2:" (foreground) or "48:2:" (background)
    if (data[pos] != '3' && data[pos] != '4') {
        return MatchResult::NoMatch;
    }
    int i = pos + 1;
    for (char expected : {'8', ':', '2', ':'}) {
        if (i >= size) {
            return MatchResult::Incomplete;
        }
        if (data[i] != expected) {
            return MatchResult::NoMatch;
        }
        i++;
    }

    // R:G:B
    for (int field = 0; field < 3; ++field) {
        int digits = 0;
        while (i < size && isDigit(data[i])) {
            digits++;
            i++;
            if (digits > MaxNumberDigits) {
                return MatchResult::NoMatch;
            }
        }
        if (i >= size) {
            return MatchResult::Incomplete;
        }
        if (digits == 0) {
            return MatchResult::NoMatch;
        }
        if (field < 2) {
            if (data[i] != ':') {
                return MatchResult::NoMatch;
            }
            i++;
        }
    }

    // A fourth number means the colorspace field is already present
    if (data[i] == ':') {
        if (i + 1 >= size) {
            return MatchResult::Incomplete;
        }
        if (isDigit(data[i + 1])) {
            return MatchResult::NoMatch;
        }
    }

    length = i - pos;
    return MatchResult::Match;
}

} // namespace Termweave
