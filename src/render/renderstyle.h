/*
 * renderstyle.h — Fonts, colors and indents used by ProjectionRenderer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_RENDERSTYLE_H
#define RICHCOMPOSER_RENDERSTYLE_H

#include "projectionmodel.h"

#include <QTextBlockFormat>
#include <QTextCharFormat>
#include <QTextFormat>

struct ComposerSettings;

// Custom format properties attached to rendered text
enum RenderProperty {
    BlockIdProperty = QTextFormat::UserProperty + 1,   // block format: blockId
    MentionUrlProperty,                                // char format: mention url
    ListDepthProperty                                  // block format: list depth
};

class RenderStyle {
public:
    RenderStyle();
    explicit RenderStyle(const ComposerSettings &settings);

    QFont bodyFont;
    QFont codeFont;
    QColor linkColor;
    QColor codeBackground;
    QColor pillBackground;
    QColor markerColor;
    qreal quoteIndent = 20.0;
    qreal listGutterWidth = 24.0;

    // Default format builders
    QTextCharFormat bodyCharFormat() const;
    QTextCharFormat codeBlockCharFormat() const;
    QTextBlockFormat bodyBlockFormat() const;
    QTextBlockFormat codeBlockBlockFormat() const;
    QTextBlockFormat blockQuoteBlockFormat(int level) const;
    QTextBlockFormat listItemBlockFormat(int depth, bool inQuote) const;

    // Left edge of list item text
    qreal listHeadIndent(int depth, bool inQuote) const;

    // Merges run attributes into a block's base char format
    void applyAttributes(QTextCharFormat &cf, const Projection::AttributeSet &attributes) const;
    void applyLink(QTextCharFormat &cf, const QString &url) const;
};

#endif // RICHCOMPOSER_RENDERSTYLE_H
