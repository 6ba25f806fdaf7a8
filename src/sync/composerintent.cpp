/*
 * composerintent.cpp — Intent names for logging
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "composerintent.h"

#include <type_traits>

QString inlineFormatName(InlineFormat format)
{
    switch (format) {
    case InlineFormat::Bold:          return QStringLiteral("bold");
    case InlineFormat::Italic:        return QStringLiteral("italic");
    case InlineFormat::StrikeThrough: return QStringLiteral("strike-through");
    case InlineFormat::Underline:     return QStringLiteral("underline");
    case InlineFormat::InlineCode:    return QStringLiteral("inline-code");
    }
    return QString();
}

QString intentName(const ComposerIntent &intent)
{
    return std::visit([](const auto &i) -> QString {
        using T = std::decay_t<decltype(i)>;
        if constexpr (std::is_same_v<T, Intent::ReplaceText>)
            return QStringLiteral("replace-text");
        else if constexpr (std::is_same_v<T, Intent::ReplaceTextIn>)
            return QStringLiteral("replace-text-in");
        else if constexpr (std::is_same_v<T, Intent::InsertParagraph>)
            return QStringLiteral("insert-paragraph");
        else if constexpr (std::is_same_v<T, Intent::Backspace>)
            return QStringLiteral("backspace");
        else if constexpr (std::is_same_v<T, Intent::DeleteIn>)
            return QStringLiteral("delete-in");
        else if constexpr (std::is_same_v<T, Intent::ToggleInlineFormat>)
            return QStringLiteral("toggle-") + inlineFormatName(i.format);
        else if constexpr (std::is_same_v<T, Intent::ToggleList>)
            return i.ordered ? QStringLiteral("toggle-ordered-list")
                             : QStringLiteral("toggle-unordered-list");
        else if constexpr (std::is_same_v<T, Intent::ToggleCodeBlock>)
            return QStringLiteral("toggle-code-block");
        else if constexpr (std::is_same_v<T, Intent::ToggleQuote>)
            return QStringLiteral("toggle-quote");
        else if constexpr (std::is_same_v<T, Intent::Undo>)
            return QStringLiteral("undo");
        else if constexpr (std::is_same_v<T, Intent::Redo>)
            return QStringLiteral("redo");
        else if constexpr (std::is_same_v<T, Intent::Indent>)
            return QStringLiteral("indent");
        else if constexpr (std::is_same_v<T, Intent::Unindent>)
            return QStringLiteral("unindent");
        else if constexpr (std::is_same_v<T, Intent::SetLink>)
            return QStringLiteral("set-link");
        else if constexpr (std::is_same_v<T, Intent::RemoveLinks>)
            return QStringLiteral("remove-links");
        else if constexpr (std::is_same_v<T, Intent::SetLinkWithText>)
            return QStringLiteral("set-link-with-text");
        else if constexpr (std::is_same_v<T, Intent::UpdateSelection>)
            return QStringLiteral("update-selection");
        else if constexpr (std::is_same_v<T, Intent::ReplaceAllHtml>)
            return QStringLiteral("replace-all-html");
        else if constexpr (std::is_same_v<T, Intent::ReplaceTextSuggestion>)
            return QStringLiteral("replace-text-suggestion");
        else if constexpr (std::is_same_v<T, Intent::InsertMentionAtSuggestion>)
            return QStringLiteral("insert-mention-at-suggestion");
        else
            return QStringLiteral("insert-at-room-mention-at-suggestion");
    }, intent);
}
