/*
 * projectionmodel.h — Block/run projection types (std::variant)
 *
 * Value types exchanged with the composer engine: the flattened block/run
 * projection of the document, the text and menu updates returned by every
 * engine call, and the decorative list-marker description handed to views.
 *
 * All offsets are UTF-16 code units, which is also QString's index space,
 * so QString::size() of a run's text is its model length.
 *
 * NOTE: Qt GUI headers (QColor, QFont) must be included BEFORE opening the
 * Projection namespace to avoid ADL issues with Qt6 macros.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_PROJECTIONMODEL_H
#define RICHCOMPOSER_PROJECTIONMODEL_H

#include <QColor>
#include <QFont>
#include <QHash>
#include <QList>
#include <QString>

#include <optional>
#include <variant>

namespace Projection {

// --- Ranges ---

struct TextRange {
    int start = 0;
    int end = 0;

    int length() const { return end - start; }
    bool isCollapsed() const { return start == end; }
    bool isBackwards() const { return start > end; }

    // Engines always work on ordered ranges
    TextRange normalized() const
    {
        return start <= end ? TextRange{start, end} : TextRange{end, start};
    }

    bool operator==(const TextRange &o) const { return start == o.start && end == o.end; }
    bool operator!=(const TextRange &o) const { return !(*this == o); }
};

using Selection = TextRange;

// --- Inline runs ---

struct AttributeSet {
    bool bold = false;
    bool italic = false;
    bool strikeThrough = false;
    bool underline = false;
    bool inlineCode = false;
    std::optional<QString> linkUrl;

    bool operator==(const AttributeSet &o) const
    {
        return bold == o.bold && italic == o.italic
            && strikeThrough == o.strikeThrough && underline == o.underline
            && inlineCode == o.inlineCode && linkUrl == o.linkUrl;
    }
    bool operator!=(const AttributeSet &o) const { return !(*this == o); }
};

struct TextRun {
    QString text;
    AttributeSet attributes;
};

// An atomic mention. The engine may count it as fewer code units than
// displayText; the renderer registers the surplus as view decoration.
struct MentionRun {
    QString url;
    QString displayText;
};

// A hard line break inside a block, one code unit
struct LineBreakRun {};

using InlineRunKind = std::variant<
    TextRun,
    MentionRun,
    LineBreakRun
>;

struct InlineRun {
    QString nodeId;
    int startUtf16 = 0;
    int endUtf16 = 0;   // exclusive
    InlineRunKind kind;

    int length() const { return endUtf16 - startUtf16; }
};

// --- Blocks ---

enum class BlockType {
    Paragraph,
    CodeBlock,
    Quote,
    ListItem,
    Generic     // root-level inline content with no block container
};

enum class ListType { Unordered, Ordered };

struct BlockKind {
    BlockType type = BlockType::Paragraph;
    ListType listType = ListType::Unordered;   // ListItem only
    int depth = 1;                             // ListItem only, 1-based

    static BlockKind paragraph() { return {}; }
    static BlockKind codeBlock() { return {BlockType::CodeBlock}; }
    static BlockKind quote() { return {BlockType::Quote}; }
    static BlockKind generic() { return {BlockType::Generic}; }
    static BlockKind listItem(ListType type, int depth)
    {
        return {BlockType::ListItem, type, depth};
    }

    bool isList() const { return type == BlockType::ListItem; }

    bool operator==(const BlockKind &o) const
    {
        if (type != o.type)
            return false;
        if (type != BlockType::ListItem)
            return true;
        return listType == o.listType && depth == o.depth;
    }
    bool operator!=(const BlockKind &o) const { return !(*this == o); }
};

struct BlockProjection {
    QString blockId;
    BlockKind kind;
    bool inQuote = false;
    int startUtf16 = 0;
    int endUtf16 = 0;   // exclusive, never includes the inter-block separator
    QList<InlineRun> inlineRuns;

    int length() const { return endUtf16 - startUtf16; }
};

// --- Engine results ---

struct KeepUpdate {};

struct ReplaceAllUpdate {
    QString replacementText;
    int startUtf16 = 0;   // selection after the update
    int endUtf16 = 0;
};

struct SelectUpdate {
    int startUtf16 = 0;
    int endUtf16 = 0;
};

using TextUpdate = std::variant<
    KeepUpdate,
    ReplaceAllUpdate,
    SelectUpdate
>;

enum class ComposerAction {
    Bold,
    Italic,
    StrikeThrough,
    Underline,
    InlineCode,
    Link,
    Undo,
    Redo,
    OrderedList,
    UnorderedList,
    Indent,
    Unindent,
    CodeBlock,
    Quote
};

inline size_t qHash(ComposerAction key, size_t seed = 0) noexcept
{
    return ::qHash(static_cast<int>(key), seed);
}

enum class ActionState {
    Enabled,
    Disabled,
    Reversed    // currently active / toggled on
};

// Only changed entries are present
using MenuStateUpdate = QHash<ComposerAction, ActionState>;

enum class PatternKey { At, Hash, Slash };

struct SuggestionPattern {
    PatternKey key = PatternKey::At;
    QString text;
    int startUtf16 = 0;
    int endUtf16 = 0;

    QChar keyChar() const
    {
        switch (key) {
        case PatternKey::At:    return QLatin1Char('@');
        case PatternKey::Hash:  return QLatin1Char('#');
        case PatternKey::Slash: return QLatin1Char('/');
        }
        return QLatin1Char('@');
    }

    bool operator==(const SuggestionPattern &o) const
    {
        return key == o.key && text == o.text
            && startUtf16 == o.startUtf16 && endUtf16 == o.endUtf16;
    }
};

struct KeepMenuAction {};
struct NoMenuAction {};     // clears any pending suggestion
struct SuggestionMenuAction {
    SuggestionPattern pattern;
};

using MenuAction = std::variant<
    KeepMenuAction,
    NoMenuAction,
    SuggestionMenuAction
>;

struct ComposerUpdate {
    TextUpdate textUpdate = KeepUpdate{};
    MenuStateUpdate menuState;      // empty = keep
    MenuAction menuAction = KeepMenuAction{};
};

// A continuous emission of engine state: projections plus the selection
// and menu state that go with them
struct Snapshot {
    QList<BlockProjection> blocks;
    Selection selection;
    MenuStateUpdate menuState;
};

// --- Decorative list markers ---

// Drawn out-of-band in the paragraph gutter, never part of model space.
struct ListMarkerInfo {
    QString text;           // "1." or bullet
    QFont font;
    QColor color;
    int characterIndex = 0; // view offset where the list item block starts
    qreal headIndent = 0;   // gutter position for drawing
};

// --- Validation ---

struct ValidationError {
    int blockIndex = -1;
    int runIndex = -1;      // -1 = block-level problem
    QString message;
};

// Checks run contiguity/ordering inside blocks and block ordering across
// the document. Returns the first violation, if any.
std::optional<ValidationError> validate(const QList<BlockProjection> &blocks);

// Visible text of a run before any mention display substitution
QString runText(const InlineRun &run);

} // namespace Projection

#endif // RICHCOMPOSER_PROJECTIONMODEL_H
