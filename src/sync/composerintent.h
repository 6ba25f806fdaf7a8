/*
 * composerintent.h — Closed set of editing intents (std::variant)
 *
 * Every intent maps to exactly one ComposerEngine call. Offsets are in
 * model space; SyncController translates view selections before building
 * an intent.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_COMPOSERINTENT_H
#define RICHCOMPOSER_COMPOSERINTENT_H

#include <QString>

#include <variant>

enum class InlineFormat {
    Bold,
    Italic,
    StrikeThrough,
    Underline,
    InlineCode
};

namespace Intent {

struct ReplaceText {
    QString text;
};

struct ReplaceTextIn {
    QString text;
    int start = 0;
    int end = 0;
};

struct InsertParagraph {};
struct Backspace {};

struct DeleteIn {
    int start = 0;
    int end = 0;
};

struct ToggleInlineFormat {
    InlineFormat format = InlineFormat::Bold;
};

struct ToggleList {
    bool ordered = false;
};

struct ToggleCodeBlock {};
struct ToggleQuote {};
struct Undo {};
struct Redo {};
struct Indent {};
struct Unindent {};

struct SetLink {
    QString url;
};

struct RemoveLinks {};

struct SetLinkWithText {
    QString url;
    QString text;
};

struct UpdateSelection {
    int start = 0;
    int end = 0;
};

// Untrusted markup; sanitized before it reaches the engine
struct ReplaceAllHtml {
    QString html;
};

// The suggestion intents act on the session's pending suggestion pattern
// and are ignored when there is none.
struct ReplaceTextSuggestion {
    QString text;
};

struct InsertMentionAtSuggestion {
    QString url;
    QString text;
};

struct InsertAtRoomMentionAtSuggestion {};

} // namespace Intent

using ComposerIntent = std::variant<
    Intent::ReplaceText,
    Intent::ReplaceTextIn,
    Intent::InsertParagraph,
    Intent::Backspace,
    Intent::DeleteIn,
    Intent::ToggleInlineFormat,
    Intent::ToggleList,
    Intent::ToggleCodeBlock,
    Intent::ToggleQuote,
    Intent::Undo,
    Intent::Redo,
    Intent::Indent,
    Intent::Unindent,
    Intent::SetLink,
    Intent::RemoveLinks,
    Intent::SetLinkWithText,
    Intent::UpdateSelection,
    Intent::ReplaceAllHtml,
    Intent::ReplaceTextSuggestion,
    Intent::InsertMentionAtSuggestion,
    Intent::InsertAtRoomMentionAtSuggestion
>;

// Short name for log messages, e.g. "toggle-list"
QString intentName(const ComposerIntent &intent);
QString inlineFormatName(InlineFormat format);

#endif // RICHCOMPOSER_COMPOSERINTENT_H
