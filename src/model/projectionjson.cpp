/*
 * projectionjson.cpp — JSON form of projections and snapshots
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "projectionjson.h"

#include <QJsonDocument>
#include <QJsonParseError>

#include <type_traits>
#include <variant>

using namespace Projection;

namespace {

struct ActionEntry {
    ComposerAction action;
    const char *name;
};

const ActionEntry kActions[] = {
    {ComposerAction::Bold,          "bold"},
    {ComposerAction::Italic,        "italic"},
    {ComposerAction::StrikeThrough, "strikeThrough"},
    {ComposerAction::Underline,     "underline"},
    {ComposerAction::InlineCode,    "inlineCode"},
    {ComposerAction::Link,          "link"},
    {ComposerAction::Undo,          "undo"},
    {ComposerAction::Redo,          "redo"},
    {ComposerAction::OrderedList,   "orderedList"},
    {ComposerAction::UnorderedList, "unorderedList"},
    {ComposerAction::Indent,        "indent"},
    {ComposerAction::Unindent,      "unindent"},
    {ComposerAction::CodeBlock,     "codeBlock"},
    {ComposerAction::Quote,         "quote"},
};

void setError(QString *errorMessage, const QString &message)
{
    if (errorMessage)
        *errorMessage = message;
}

QString kindName(const BlockKind &kind)
{
    switch (kind.type) {
    case BlockType::Paragraph: return QStringLiteral("paragraph");
    case BlockType::CodeBlock: return QStringLiteral("codeBlock");
    case BlockType::Quote:     return QStringLiteral("quote");
    case BlockType::Generic:   return QStringLiteral("generic");
    case BlockType::ListItem:
        return kind.listType == ListType::Ordered ? QStringLiteral("orderedList")
                                                  : QStringLiteral("unorderedList");
    }
    return QString();
}

std::optional<BlockKind> kindFromJson(const QJsonObject &obj)
{
    const QString kind = obj.value(QLatin1String("kind")).toString(QStringLiteral("paragraph"));
    const int depth = obj.value(QLatin1String("depth")).toInt(1);
    if (kind == QLatin1String("paragraph"))
        return BlockKind::paragraph();
    if (kind == QLatin1String("codeBlock"))
        return BlockKind::codeBlock();
    if (kind == QLatin1String("quote"))
        return BlockKind::quote();
    if (kind == QLatin1String("generic"))
        return BlockKind::generic();
    if (kind == QLatin1String("orderedList"))
        return BlockKind::listItem(ListType::Ordered, depth);
    if (kind == QLatin1String("unorderedList"))
        return BlockKind::listItem(ListType::Unordered, depth);
    return std::nullopt;
}

QJsonObject runToJson(const InlineRun &run)
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = run.nodeId;
    obj[QStringLiteral("start")] = run.startUtf16;
    obj[QStringLiteral("end")] = run.endUtf16;

    std::visit([&obj](const auto &kind) {
        using T = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<T, TextRun>) {
            obj[QStringLiteral("type")] = QStringLiteral("text");
            obj[QStringLiteral("text")] = kind.text;
            const AttributeSet &a = kind.attributes;
            if (a.bold)
                obj[QStringLiteral("bold")] = true;
            if (a.italic)
                obj[QStringLiteral("italic")] = true;
            if (a.strikeThrough)
                obj[QStringLiteral("strikeThrough")] = true;
            if (a.underline)
                obj[QStringLiteral("underline")] = true;
            if (a.inlineCode)
                obj[QStringLiteral("inlineCode")] = true;
            if (a.linkUrl)
                obj[QStringLiteral("link")] = *a.linkUrl;
        } else if constexpr (std::is_same_v<T, MentionRun>) {
            obj[QStringLiteral("type")] = QStringLiteral("mention");
            obj[QStringLiteral("url")] = kind.url;
            obj[QStringLiteral("displayText")] = kind.displayText;
        } else {
            obj[QStringLiteral("type")] = QStringLiteral("lineBreak");
        }
    }, run.kind);
    return obj;
}

std::optional<InlineRun> runFromJson(const QJsonObject &obj, QString *errorMessage)
{
    InlineRun run;
    run.nodeId = obj.value(QLatin1String("id")).toString();
    if (!obj.contains(QLatin1String("start"))) {
        setError(errorMessage, QStringLiteral("run is missing \"start\""));
        return std::nullopt;
    }
    run.startUtf16 = obj.value(QLatin1String("start")).toInt();

    const QString type = obj.value(QLatin1String("type")).toString(QStringLiteral("text"));
    int defaultLength = 1;
    if (type == QLatin1String("text")) {
        TextRun text;
        text.text = obj.value(QLatin1String("text")).toString();
        text.attributes.bold = obj.value(QLatin1String("bold")).toBool();
        text.attributes.italic = obj.value(QLatin1String("italic")).toBool();
        text.attributes.strikeThrough = obj.value(QLatin1String("strikeThrough")).toBool();
        text.attributes.underline = obj.value(QLatin1String("underline")).toBool();
        text.attributes.inlineCode = obj.value(QLatin1String("inlineCode")).toBool();
        if (obj.contains(QLatin1String("link")))
            text.attributes.linkUrl = obj.value(QLatin1String("link")).toString();
        defaultLength = text.text.size();
        run.kind = text;
    } else if (type == QLatin1String("mention")) {
        MentionRun mention;
        mention.url = obj.value(QLatin1String("url")).toString();
        mention.displayText = obj.value(QLatin1String("displayText")).toString();
        run.kind = mention;
    } else if (type == QLatin1String("lineBreak")) {
        run.kind = LineBreakRun{};
    } else {
        setError(errorMessage, QStringLiteral("unknown run type \"%1\"").arg(type));
        return std::nullopt;
    }

    run.endUtf16 = obj.value(QLatin1String("end")).toInt(run.startUtf16 + defaultLength);
    return run;
}

} // anonymous namespace

namespace ProjectionJson {

QString actionName(ComposerAction action)
{
    for (const ActionEntry &entry : kActions) {
        if (entry.action == action)
            return QString::fromLatin1(entry.name);
    }
    return QString();
}

std::optional<ComposerAction> actionFromName(const QString &name)
{
    for (const ActionEntry &entry : kActions) {
        if (name == QLatin1String(entry.name))
            return entry.action;
    }
    return std::nullopt;
}

QString actionStateName(ActionState state)
{
    switch (state) {
    case ActionState::Enabled:  return QStringLiteral("enabled");
    case ActionState::Disabled: return QStringLiteral("disabled");
    case ActionState::Reversed: return QStringLiteral("reversed");
    }
    return QString();
}

std::optional<ActionState> actionStateFromName(const QString &name)
{
    if (name == QLatin1String("enabled"))
        return ActionState::Enabled;
    if (name == QLatin1String("disabled"))
        return ActionState::Disabled;
    if (name == QLatin1String("reversed"))
        return ActionState::Reversed;
    return std::nullopt;
}

QJsonArray blocksToJson(const QList<BlockProjection> &blocks)
{
    QJsonArray array;
    for (const BlockProjection &block : blocks) {
        QJsonObject obj;
        obj[QStringLiteral("id")] = block.blockId;
        obj[QStringLiteral("kind")] = kindName(block.kind);
        if (block.kind.isList())
            obj[QStringLiteral("depth")] = block.kind.depth;
        if (block.inQuote)
            obj[QStringLiteral("inQuote")] = true;
        obj[QStringLiteral("start")] = block.startUtf16;
        obj[QStringLiteral("end")] = block.endUtf16;

        QJsonArray runs;
        for (const InlineRun &run : block.inlineRuns)
            runs.append(runToJson(run));
        obj[QStringLiteral("runs")] = runs;
        array.append(obj);
    }
    return array;
}

std::optional<QList<BlockProjection>> blocksFromJson(const QJsonArray &array,
                                                     QString *errorMessage)
{
    QList<BlockProjection> blocks;
    for (int b = 0; b < array.size(); ++b) {
        const QJsonObject obj = array.at(b).toObject();

        BlockProjection block;
        block.blockId = obj.value(QLatin1String("id")).toString();
        const auto kind = kindFromJson(obj);
        if (!kind) {
            setError(errorMessage, QStringLiteral("block %1: unknown kind \"%2\"")
                                       .arg(b).arg(obj.value(QLatin1String("kind")).toString()));
            return std::nullopt;
        }
        block.kind = *kind;
        block.inQuote = obj.value(QLatin1String("inQuote")).toBool();
        block.startUtf16 = obj.value(QLatin1String("start")).toInt();

        const QJsonArray runs = obj.value(QLatin1String("runs")).toArray();
        for (int r = 0; r < runs.size(); ++r) {
            QString runError;
            const auto run = runFromJson(runs.at(r).toObject(), &runError);
            if (!run) {
                setError(errorMessage, QStringLiteral("block %1 run %2: %3").arg(b).arg(r).arg(runError));
                return std::nullopt;
            }
            block.inlineRuns.append(*run);
        }

        const int lastEnd = block.inlineRuns.isEmpty() ? block.startUtf16
                                                       : block.inlineRuns.last().endUtf16;
        block.endUtf16 = obj.value(QLatin1String("end")).toInt(lastEnd);
        blocks.append(block);
    }
    return blocks;
}

std::optional<Snapshot> readSnapshot(const QByteArray &json, QString *errorMessage)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorMessage, parseError.errorString());
        return std::nullopt;
    }
    if (!doc.isObject()) {
        setError(errorMessage, QStringLiteral("top level is not an object"));
        return std::nullopt;
    }

    const QJsonObject root = doc.object();
    Snapshot snapshot;
    const auto blocks = blocksFromJson(root.value(QLatin1String("blocks")).toArray(),
                                       errorMessage);
    if (!blocks)
        return std::nullopt;
    snapshot.blocks = *blocks;

    const QJsonObject selection = root.value(QLatin1String("selection")).toObject();
    snapshot.selection.start = selection.value(QLatin1String("start")).toInt();
    snapshot.selection.end = selection.value(QLatin1String("end"))
                                 .toInt(snapshot.selection.start);

    const QJsonObject menuState = root.value(QLatin1String("menuState")).toObject();
    for (auto it = menuState.constBegin(); it != menuState.constEnd(); ++it) {
        const auto action = actionFromName(it.key());
        const auto state = actionStateFromName(it.value().toString());
        if (!action || !state) {
            setError(errorMessage, QStringLiteral("invalid menu state \"%1\"").arg(it.key()));
            return std::nullopt;
        }
        snapshot.menuState.insert(*action, *state);
    }
    return snapshot;
}

QByteArray writeSnapshot(const Snapshot &snapshot)
{
    QJsonObject root;
    root[QStringLiteral("blocks")] = blocksToJson(snapshot.blocks);

    QJsonObject selection;
    selection[QStringLiteral("start")] = snapshot.selection.start;
    selection[QStringLiteral("end")] = snapshot.selection.end;
    root[QStringLiteral("selection")] = selection;

    if (!snapshot.menuState.isEmpty()) {
        QJsonObject menuState;
        for (auto it = snapshot.menuState.cbegin(); it != snapshot.menuState.cend(); ++it)
            menuState[actionName(it.key())] = actionStateName(it.value());
        root[QStringLiteral("menuState")] = menuState;
    }

    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

} // namespace ProjectionJson
