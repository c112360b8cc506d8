/*
 * test_linebreaker.cpp --- Greedy word wrapping
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "linebreaker.h"

// One point per character.
static qreal charCount(const QString &s)
{
    return s.size();
}

TEST(LineBreakerTest, ShortTextStaysOnOneLine) {
    EXPECT_EQ(LineBreaking::wrapText(QStringLiteral("File the annual report"), 100, charCount),
              QStringList{QStringLiteral("File the annual report")});
}

TEST(LineBreakerTest, WrapsAtWordBoundaries) {
    const QStringList lines = LineBreaking::wrapText(
        QStringLiteral("aaa bbb ccc ddd"), 7, charCount);
    EXPECT_EQ(lines, (QStringList{QStringLiteral("aaa bbb"), QStringLiteral("ccc ddd")}));
}

TEST(LineBreakerTest, LineExactlyAtWidthFits) {
    const QStringList lines = LineBreaking::wrapText(
        QStringLiteral("abcd efgh"), 9, charCount);
    EXPECT_EQ(lines, QStringList{QStringLiteral("abcd efgh")});
}

TEST(LineBreakerTest, OversizeWordGetsItsOwnLine) {
    const QStringList lines = LineBreaking::wrapText(
        QStringLiteral("see https://example.gov/very/long/filing/portal/path now"), 10, charCount);
    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[0], QStringLiteral("see"));
    EXPECT_EQ(lines[1], QStringLiteral("https://example.gov/very/long/filing/portal/path"));
    EXPECT_EQ(lines[2], QStringLiteral("now"));
}

TEST(LineBreakerTest, CollapsesWhitespaceRuns) {
    EXPECT_EQ(LineBreaking::wrapText(QStringLiteral("  a \t  b   "), 100, charCount),
              QStringList{QStringLiteral("a b")});
}

TEST(LineBreakerTest, NewlineIsAHardBreak) {
    EXPECT_EQ(LineBreaking::wrapText(QStringLiteral("first\nsecond"), 100, charCount),
              (QStringList{QStringLiteral("first"), QStringLiteral("second")}));
}

TEST(LineBreakerTest, EmptyTextHasNoLines) {
    EXPECT_TRUE(LineBreaking::wrapText(QString(), 100, charCount).isEmpty());
    EXPECT_TRUE(LineBreaking::wrapText(QStringLiteral(" \n\t "), 100, charCount).isEmpty());
}

TEST(LineBreakerTest, NoLineExceedsWidthUnlessSingleWord) {
    const QString text = QStringLiteral(
        "Every business entity registered in the state must file an annual "
        "report with the Secretary of State by the fifteenth of April.");
    const qreal width = 24;
    const QStringList lines = LineBreaking::wrapText(text, width, charCount);
    ASSERT_GT(lines.size(), 1);
    for (const QString &line : lines) {
        if (line.contains(QLatin1Char(' ')))
            EXPECT_LE(charCount(line), width) << line.toStdString();
    }
    EXPECT_EQ(lines.join(QLatin1Char(' ')), text);
}
