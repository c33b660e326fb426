/*
    SPDX-FileCopyrightText: 2025 Termweave contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "EscapeSequenceNormalizerTest.h"

#include <QTest>

#include "../output/EscapeSequenceNormalizer.h"

using namespace Termweave;

namespace
{

QByteArray normalizeWhole(const QByteArray &stream)
{
    EscapeSequenceNormalizer normalizer;
    return normalizer.normalize(stream) + normalizer.flush();
}

const QByteArray MixedStream = QByteArrayLiteral(
    "$ ls\r\n"
    "\x1b[38:2:255:128:0mREADME.md\x1b[0m  "
    "\x1b[48:2:10:20:30;1mbuild\x1b[0m  "
    "\x1b[38:2:0:1:2:3mkept\x1b[0m  "
    "\x1b[38;2;1;2;3msemicolons\x1b[0m\r\n"
    "\x1b[38:2:1:2:3m");

}

void EscapeSequenceNormalizerTest::testRewrite_data()
{
    QTest::addColumn<QByteArray>("input");
    QTest::addColumn<QByteArray>("expected");

    QTest::newRow("foreground") << QByteArray("\x1b[38:2:255:128:0mX") << QByteArray("\x1b[38:2::255:128:0mX");
    QTest::newRow("background") << QByteArray("\x1b[48:2:1:2:3mX") << QByteArray("\x1b[48:2::1:2:3mX");
    QTest::newRow("two in one sequence") << QByteArray("\x1b[38:2:1:2:3;48:2:4:5:6mX") << QByteArray("\x1b[38:2::1:2:3;48:2::4:5:6mX");
    QTest::newRow("colorspace present") << QByteArray("\x1b[38:2:0:1:2:3mX") << QByteArray("\x1b[38:2:0:1:2:3mX");
    QTest::newRow("empty colorspace") << QByteArray("\x1b[38:2::1:2:3mX") << QByteArray("\x1b[38:2::1:2:3mX");
    QTest::newRow("semicolon form") << QByteArray("\x1b[38;2;1;2;3mX") << QByteArray("\x1b[38;2;1;2;3mX");
    QTest::newRow("indexed color") << QByteArray("\x1b[38:5:208mX") << QByteArray("\x1b[38:5:208mX");
    QTest::newRow("overlong number") << QByteArray("\x1b[38:2:12345678901:0:0mX") << QByteArray("\x1b[38:2:12345678901:0:0mX");
    QTest::newRow("longest number") << QByteArray("\x1b[38:2:1234567890:0:0mX") << QByteArray("\x1b[38:2::1234567890:0:0mX");
    QTest::newRow("plain text") << QByteArray("34 bytes in 48 ms") << QByteArray("34 bytes in 48 ms");
}

void EscapeSequenceNormalizerTest::testRewrite()
{
    QFETCH(QByteArray, input);
    QFETCH(QByteArray, expected);

    QCOMPARE(normalizeWhole(input), expected);
}

void EscapeSequenceNormalizerTest::testIncompleteSequenceIsHeldBack()
{
    EscapeSequenceNormalizer normalizer;

    QCOMPARE(normalizer.normalize(QByteArray("ok\x1b[38:2:1")), QByteArray("ok\x1b["));
    QVERIFY(normalizer.hasResidual());

    QCOMPARE(normalizer.normalize(QByteArray("0:20:30mdone")), QByteArray("38:2::10:20:30mdone"));
    QVERIFY(!normalizer.hasResidual());
}

void EscapeSequenceNormalizerTest::testFlushReturnsResidualVerbatim()
{
    EscapeSequenceNormalizer normalizer;

    QCOMPARE(normalizer.normalize(QByteArray("\x1b[48:2:1:2:3")), QByteArray("\x1b["));
    QCOMPARE(normalizer.flush(), QByteArray("48:2:1:2:3"));
    QVERIFY(!normalizer.hasResidual());
    QCOMPARE(normalizer.flush(), QByteArray());
}

void EscapeSequenceNormalizerTest::testEverySplitMatchesWholeStream()
{
    const QByteArray expected = normalizeWhole(MixedStream);
    QCOMPARE(expected.count("38:2::"), 2);
    QCOMPARE(expected.count("48:2::"), 1);

    for (int first = 0; first <= MixedStream.size(); ++first) {
        for (int second = first; second <= MixedStream.size(); ++second) {
            EscapeSequenceNormalizer normalizer;
            QByteArray output;
            output += normalizer.normalize(MixedStream.left(first));
            output += normalizer.normalize(MixedStream.mid(first, second - first));
            output += normalizer.normalize(MixedStream.mid(second));
            output += normalizer.flush();
            if (output != expected) {
                QFAIL(qPrintable(QStringLiteral("split at %1/%2 differs").arg(first).arg(second)));
            }
        }
    }
}

void EscapeSequenceNormalizerTest::testByteByByteMatchesWholeStream()
{
    EscapeSequenceNormalizer normalizer;
    QByteArray output;
    for (char c : MixedStream) {
        output += normalizer.normalize(QByteArray(1, c));
    }
    output += normalizer.flush();

    QCOMPARE(output, normalizeWhole(MixedStream));
}

QTEST_GUILESS_MAIN(EscapeSequenceNormalizerTest)

#include "moc_EscapeSequenceNormalizerTest.cpp"
