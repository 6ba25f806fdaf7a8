/*
 * stringdiffer_test.cpp — Replacement extraction and whitespace folding
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "stringdiffer.h"

namespace {

StringReplacement replacementOf(const QString &oldText, const QString &newText)
{
    const auto r = StringDiffer::replacement(oldText, newText);
    EXPECT_TRUE(r.has_value()) << oldText.toStdString() << " -> " << newText.toStdString();
    return r.value_or(StringReplacement{});
}

} // anonymous namespace

TEST(StringDifferTest, RemovesTrailingText)
{
    EXPECT_EQ(replacementOf(QStringLiteral("text"), QStringLiteral("te")),
              (StringReplacement{2, 2, QString(), false}));
}

TEST(StringDifferTest, AppendsText)
{
    EXPECT_EQ(replacementOf(QStringLiteral("te"), QStringLiteral("text")),
              (StringReplacement{2, 0, QStringLiteral("xt"), false}));
}

TEST(StringDifferTest, InsertsInTheMiddle)
{
    EXPECT_EQ(replacementOf(QStringLiteral("abc"), QStringLiteral("abXc")),
              (StringReplacement{2, 0, QStringLiteral("X"), false}));
}

TEST(StringDifferTest, ReplacesCompositionWithCommittedText)
{
    EXPECT_EQ(replacementOf(QStringLiteral("wa"), QString::fromUtf8("わ")),
              (StringReplacement{0, 2, QString::fromUtf8("わ"), false}));
    EXPECT_EQ(replacementOf(QString::fromUtf8("わta"), QString::fromUtf8("わた")),
              (StringReplacement{1, 2, QString::fromUtf8("た"), false}));
}

TEST(StringDifferTest, SplitsDisjointSubstitutions)
{
    const QString target = QStringLiteral("fexf");
    const StringReplacement first = replacementOf(QStringLiteral("text"), target);
    EXPECT_EQ(first, (StringReplacement{0, 1, QStringLiteral("f"), true}));

    const QString intermediate = StringDiffer::apply(QStringLiteral("text"), first);
    EXPECT_EQ(intermediate, QStringLiteral("fext"));
    EXPECT_EQ(replacementOf(intermediate, target),
              (StringReplacement{3, 1, QStringLiteral("f"), false}));
}

TEST(StringDifferTest, RemovalBeforeDistantInsertion)
{
    const QString target = QStringLiteral("extab");
    const StringReplacement first = replacementOf(QStringLiteral("text"), target);
    EXPECT_EQ(first, (StringReplacement{0, 1, QString(), true}));

    const QString intermediate = StringDiffer::apply(QStringLiteral("text"), first);
    EXPECT_EQ(intermediate, QStringLiteral("ext"));
    EXPECT_EQ(replacementOf(intermediate, target),
              (StringReplacement{3, 0, QStringLiteral("ab"), false}));
}

TEST(StringDifferTest, LeadingWhitespaceDoesNotShiftLocation)
{
    EXPECT_EQ(replacementOf(QStringLiteral(" text"), QStringLiteral(" test")),
              (StringReplacement{3, 1, QStringLiteral("s"), false}));

    const QString mixed = QStringLiteral(" ") + QChar(0x00A0) + QStringLiteral(" ");
    EXPECT_EQ(replacementOf(mixed + QStringLiteral("text"), mixed + QStringLiteral("test")),
              (StringReplacement{5, 1, QStringLiteral("s"), false}));
}

TEST(StringDifferTest, DistantEditsInLongText)
{
    const QString body(2000, QLatin1Char('m'));
    EXPECT_EQ(replacementOf(QLatin1Char('A') + body + QLatin1Char('B'),
                            QLatin1Char('C') + body + QLatin1Char('D')),
              (StringReplacement{0, 1, QStringLiteral("C"), true}));
}

TEST(StringDifferTest, DeeplyDifferentTextIsReplacedWhole)
{
    const QString oldText(3000, QLatin1Char('a'));
    const QString newText(3000, QLatin1Char('b'));
    EXPECT_EQ(replacementOf(oldText, newText), (StringReplacement{0, 3000, newText, false}));

    const QString longer = newText + newText;
    EXPECT_EQ(replacementOf(oldText, longer), (StringReplacement{0, 3000, longer, false}));
}

TEST(StringDifferTest, DoubleSpaceBecomesFullStop)
{
    EXPECT_EQ(replacementOf(QStringLiteral("a  "), QStringLiteral("a.")),
              (StringReplacement{1, 2, QStringLiteral("."), false}));
}

TEST(StringDifferTest, WhitespaceKindsAreEquivalent)
{
    const QString nbsp = QStringLiteral("a") + QChar(0x00A0) + QStringLiteral("b");
    EXPECT_FALSE(StringDiffer::replacement(QStringLiteral("a b"), nbsp).has_value());
    EXPECT_FALSE(StringDiffer::replacement(QStringLiteral("same"), QStringLiteral("same")).has_value());

    EXPECT_TRUE(StringDiffer::isEquivalent(QStringLiteral("a b"), nbsp));
    EXPECT_TRUE(StringDiffer::isEquivalent(QStringLiteral("a\tb"), QStringLiteral("a b")));
    EXPECT_FALSE(StringDiffer::isEquivalent(QStringLiteral("a b"), QStringLiteral("a  b")));
    EXPECT_FALSE(StringDiffer::isEquivalent(QStringLiteral("ab"), QStringLiteral("ac")));
}

TEST(StringDifferTest, FoldsParagraphSeparators)
{
    const QString folded = StringDiffer::foldWhitespace(QStringLiteral("a") + QChar(0x2029)
                                                        + QStringLiteral("b"));
    EXPECT_EQ(folded.at(1), QChar(0x00A0));
    EXPECT_EQ(folded.at(0), QLatin1Char('a'));
}

TEST(StringDifferTest, PatchSequenceReachesTarget)
{
    const QString source = QStringLiteral("the quick brown fox");
    const QString target = QStringLiteral("a quick red fox!");
    const auto patches = StringDiffer::patchSequence(source, target, 16);
    ASSERT_TRUE(patches.has_value());
    ASSERT_FALSE(patches->isEmpty());

    QString current = source;
    for (const StringReplacement &patch : *patches)
        current = StringDiffer::apply(current, patch);
    EXPECT_EQ(current, target);
    EXPECT_FALSE(patches->last().hasMore);
}

TEST(StringDifferTest, PatchSequenceOfEquivalentTextsIsEmpty)
{
    const auto patches = StringDiffer::patchSequence(QStringLiteral("a b"),
                                                     QStringLiteral("a\tb"), 4);
    ASSERT_TRUE(patches.has_value());
    EXPECT_TRUE(patches->isEmpty());
}

TEST(StringDifferTest, PatchSequenceGivesUpAtCap)
{
    // Needs two patches
    EXPECT_FALSE(StringDiffer::patchSequence(QStringLiteral("text"),
                                             QStringLiteral("fexf"), 1).has_value());
    EXPECT_TRUE(StringDiffer::patchSequence(QStringLiteral("text"),
                                            QStringLiteral("fexf"), 2).has_value());
}

TEST(StringDifferTest, FullReplacementCoversOldText)
{
    const StringReplacement r = StringDiffer::fullReplacement(QStringLiteral("abc"),
                                                              QStringLiteral("xy"));
    EXPECT_EQ(r, (StringReplacement{0, 3, QStringLiteral("xy"), false}));
    EXPECT_EQ(StringDiffer::apply(QStringLiteral("abc"), r), QStringLiteral("xy"));
}
