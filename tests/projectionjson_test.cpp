/*
 * projectionjson_test.cpp — Projection snapshots as JSON
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "projectionjson.h"

using namespace Projection;

TEST(ProjectionJsonTest, ReadsBlocksWithDefaults)
{
    const QByteArray json = R"({
        "blocks": [
            {"id": "b1", "runs": [
                {"id": "r1", "start": 0, "text": "hi", "bold": true},
                {"id": "r2", "type": "mention", "start": 2,
                 "url": "https://matrix.to/#/@alice:example.org", "displayText": "Alice"}
            ]},
            {"id": "b2", "kind": "orderedList", "depth": 2, "start": 4,
             "runs": [{"start": 4, "text": "item", "link": "https://example.org"}]}
        ],
        "selection": {"start": 1}
    })";

    QString error;
    const auto snapshot = ProjectionJson::readSnapshot(json, &error);
    ASSERT_TRUE(snapshot.has_value()) << error.toStdString();
    ASSERT_EQ(snapshot->blocks.size(), 2);

    const BlockProjection &first = snapshot->blocks[0];
    EXPECT_EQ(first.blockId, QStringLiteral("b1"));
    EXPECT_EQ(first.kind, BlockKind::paragraph());
    EXPECT_EQ(first.startUtf16, 0);
    EXPECT_EQ(first.endUtf16, 3);
    ASSERT_EQ(first.inlineRuns.size(), 2);

    const auto *text = std::get_if<TextRun>(&first.inlineRuns[0].kind);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->text, QStringLiteral("hi"));
    EXPECT_TRUE(text->attributes.bold);
    EXPECT_FALSE(text->attributes.italic);
    EXPECT_EQ(first.inlineRuns[0].endUtf16, 2);

    const auto *mention = std::get_if<MentionRun>(&first.inlineRuns[1].kind);
    ASSERT_NE(mention, nullptr);
    EXPECT_EQ(mention->displayText, QStringLiteral("Alice"));
    EXPECT_EQ(first.inlineRuns[1].endUtf16, 3);

    const BlockProjection &second = snapshot->blocks[1];
    EXPECT_EQ(second.kind, BlockKind::listItem(ListType::Ordered, 2));
    EXPECT_EQ(second.endUtf16, 8);
    const auto *link = std::get_if<TextRun>(&second.inlineRuns[0].kind);
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->attributes.linkUrl, QStringLiteral("https://example.org"));

    EXPECT_EQ(snapshot->selection, (TextRange{1, 1}));
    EXPECT_TRUE(snapshot->menuState.isEmpty());
    EXPECT_FALSE(validate(snapshot->blocks).has_value());
}

TEST(ProjectionJsonTest, ReadsLineBreaksAndMenuState)
{
    const QByteArray json = R"({
        "blocks": [{"kind": "quote", "runs": [
            {"start": 0, "text": "a"},
            {"start": 1, "type": "lineBreak"},
            {"start": 2, "text": "b"}]}],
        "menuState": {"bold": "reversed", "undo": "disabled"}
    })";

    const auto snapshot = ProjectionJson::readSnapshot(json);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->blocks[0].kind, BlockKind::quote());
    EXPECT_TRUE(std::holds_alternative<LineBreakRun>(snapshot->blocks[0].inlineRuns[1].kind));
    EXPECT_EQ(snapshot->blocks[0].endUtf16, 3);
    EXPECT_EQ(snapshot->menuState.value(ComposerAction::Bold), ActionState::Reversed);
    EXPECT_EQ(snapshot->menuState.value(ComposerAction::Undo), ActionState::Disabled);
    EXPECT_EQ(snapshot->menuState.size(), 2);
}

TEST(ProjectionJsonTest, ReportsErrors)
{
    QString error;
    EXPECT_FALSE(ProjectionJson::readSnapshot("{not json", &error).has_value());
    EXPECT_FALSE(error.isEmpty());

    error.clear();
    EXPECT_FALSE(ProjectionJson::readSnapshot("[]", &error).has_value());
    EXPECT_FALSE(error.isEmpty());

    error.clear();
    EXPECT_FALSE(ProjectionJson::readSnapshot(R"({"blocks": [{"kind": "table"}]})", &error)
                     .has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("table")));

    error.clear();
    EXPECT_FALSE(ProjectionJson::readSnapshot(
                     R"({"blocks": [{"runs": [{"start": 0, "type": "image"}]}]})", &error)
                     .has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("image")));

    error.clear();
    EXPECT_FALSE(ProjectionJson::readSnapshot(R"({"blocks": [{"runs": [{"text": "x"}]}]})", &error)
                     .has_value());
    EXPECT_FALSE(error.isEmpty());

    EXPECT_FALSE(ProjectionJson::readSnapshot(R"({"menuState": {"bold": "maybe"}})").has_value());
    EXPECT_FALSE(ProjectionJson::readSnapshot(R"({"menuState": {"table": "enabled"}})").has_value());
}

TEST(ProjectionJsonTest, WrittenSnapshotReadsBack)
{
    Snapshot snapshot;
    BlockProjection block;
    block.blockId = QStringLiteral("b");
    block.kind = BlockKind::listItem(ListType::Unordered, 1);
    block.inQuote = true;
    block.startUtf16 = 0;
    block.endUtf16 = 4;
    InlineRun run;
    run.nodeId = QStringLiteral("r");
    run.startUtf16 = 0;
    run.endUtf16 = 4;
    TextRun text;
    text.text = QStringLiteral("code");
    text.attributes.inlineCode = true;
    text.attributes.underline = true;
    run.kind = text;
    block.inlineRuns.append(run);
    snapshot.blocks.append(block);
    snapshot.selection = {4, 0};
    snapshot.menuState.insert(ComposerAction::InlineCode, ActionState::Reversed);

    const auto read = ProjectionJson::readSnapshot(ProjectionJson::writeSnapshot(snapshot));
    ASSERT_TRUE(read.has_value());
    ASSERT_EQ(read->blocks.size(), 1);
    const BlockProjection &b = read->blocks[0];
    EXPECT_EQ(b.blockId, block.blockId);
    EXPECT_EQ(b.kind, block.kind);
    EXPECT_TRUE(b.inQuote);
    EXPECT_EQ(b.endUtf16, 4);
    ASSERT_EQ(b.inlineRuns.size(), 1);
    EXPECT_EQ(b.inlineRuns[0].nodeId, QStringLiteral("r"));
    const auto *readText = std::get_if<TextRun>(&b.inlineRuns[0].kind);
    ASSERT_NE(readText, nullptr);
    EXPECT_EQ(readText->attributes, text.attributes);
    EXPECT_EQ(read->selection, (TextRange{4, 0}));
    EXPECT_EQ(read->menuState, snapshot.menuState);
}

TEST(ProjectionJsonTest, NamesEveryAction)
{
    const QList<ComposerAction> actions = {
        ComposerAction::Bold, ComposerAction::Italic, ComposerAction::StrikeThrough,
        ComposerAction::Underline, ComposerAction::InlineCode, ComposerAction::Link,
        ComposerAction::Undo, ComposerAction::Redo, ComposerAction::OrderedList,
        ComposerAction::UnorderedList, ComposerAction::Indent, ComposerAction::Unindent,
        ComposerAction::CodeBlock, ComposerAction::Quote,
    };
    for (ComposerAction action : actions) {
        const QString name = ProjectionJson::actionName(action);
        EXPECT_FALSE(name.isEmpty());
        EXPECT_EQ(ProjectionJson::actionFromName(name), action);
    }
    EXPECT_EQ(ProjectionJson::actionName(ComposerAction::StrikeThrough), QStringLiteral("strikeThrough"));
    EXPECT_FALSE(ProjectionJson::actionFromName(QStringLiteral("Bold")).has_value());

    EXPECT_EQ(ProjectionJson::actionStateFromName(QStringLiteral("enabled")), ActionState::Enabled);
    EXPECT_EQ(ProjectionJson::actionStateName(ActionState::Reversed), QStringLiteral("reversed"));
}
