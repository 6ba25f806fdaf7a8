/*
 * renderstyle.cpp — Fonts, colors and indents used by ProjectionRenderer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "renderstyle.h"
#include "composersettings.h"

RenderStyle::RenderStyle()
    : RenderStyle(ComposerSettings())
{
}

RenderStyle::RenderStyle(const ComposerSettings &settings)
    : bodyFont(settings.bodyFont)
    , codeFont(settings.codeFont)
    , linkColor(settings.linkColor)
    , codeBackground(settings.codeBackground)
    , pillBackground(settings.pillBackground)
    , markerColor(settings.markerColor)
    , quoteIndent(settings.quoteIndent)
    , listGutterWidth(settings.listGutterWidth)
{
}

QTextCharFormat RenderStyle::bodyCharFormat() const
{
    QTextCharFormat cf;
    cf.setFont(bodyFont);
    return cf;
}

QTextCharFormat RenderStyle::codeBlockCharFormat() const
{
    QTextCharFormat cf;
    QFont mono = codeFont;
    mono.setStyleHint(QFont::Monospace);
    mono.setFixedPitch(true);
    cf.setFont(mono);
    return cf;
}

QTextBlockFormat RenderStyle::bodyBlockFormat() const
{
    QTextBlockFormat bf;
    bf.setBottomMargin(4.0);
    return bf;
}

QTextBlockFormat RenderStyle::codeBlockBlockFormat() const
{
    QTextBlockFormat bf;
    bf.setBackground(codeBackground);
    bf.setNonBreakableLines(true);
    bf.setTopMargin(2.0);
    bf.setBottomMargin(2.0);
    return bf;
}

QTextBlockFormat RenderStyle::blockQuoteBlockFormat(int level) const
{
    QTextBlockFormat bf;
    bf.setProperty(QTextFormat::BlockQuoteLevel, level);
    bf.setLeftMargin(quoteIndent * level);
    bf.setBottomMargin(4.0);
    return bf;
}

qreal RenderStyle::listHeadIndent(int depth, bool inQuote) const
{
    return listGutterWidth * depth + (inQuote ? quoteIndent : 0.0);
}

QTextBlockFormat RenderStyle::listItemBlockFormat(int depth, bool inQuote) const
{
    QTextBlockFormat bf = inQuote ? blockQuoteBlockFormat(1) : bodyBlockFormat();
    bf.setLeftMargin(listHeadIndent(depth, inQuote));
    bf.setProperty(ListDepthProperty, depth);
    return bf;
}

void RenderStyle::applyAttributes(QTextCharFormat &cf,
                                  const Projection::AttributeSet &attributes) const
{
    if (attributes.bold)
        cf.setFontWeight(QFont::Bold);
    if (attributes.italic)
        cf.setFontItalic(true);
    if (attributes.underline)
        cf.setFontUnderline(true);
    if (attributes.strikeThrough)
        cf.setFontStrikeOut(true);
    if (attributes.inlineCode) {
        cf.setFontFamilies({codeFont.family()});
        cf.setFontStyleHint(QFont::Monospace);
        cf.setFontFixedPitch(true);
        cf.setBackground(codeBackground);
    }
    if (attributes.linkUrl)
        applyLink(cf, *attributes.linkUrl);
}

void RenderStyle::applyLink(QTextCharFormat &cf, const QString &url) const
{
    cf.setAnchor(true);
    cf.setAnchorHref(url);
    cf.setForeground(linkColor);
    cf.setFontUnderline(true);
}
