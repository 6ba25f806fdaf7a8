/*
 * projectionrenderer.h — Block/run projections to a styled QTextDocument
 *
 * Each block becomes one QTextBlock. Every model code unit maps to exactly
 * one view character; characters the model does not know about (separators
 * between abutting blocks, inline list markers, surplus mention text) are
 * recorded in the result's DecorationRegistry so an IndexMapper can
 * translate offsets.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_PROJECTIONRENDERER_H
#define RICHCOMPOSER_PROJECTIONRENDERER_H

#include "decorationregistry.h"
#include "indexmapper.h"
#include "listdecoration.h"
#include "projectionmodel.h"
#include "renderstyle.h"

#include <QTextDocument>
#include <QTextLayout>

#include <memory>

class MentionDisplayHandler;

struct RenderedRun {
    int blockIndex = -1;
    int runIndex = -1;
    QString nodeId;
    int viewStart = 0;
    int viewEnd = 0;        // includes any surplus mention text
    int modelStart = 0;
    int modelEnd = 0;
};

// One rendered block before it is placed into a document. Offsets are
// relative to the start of the block's view text.
struct StyledFragment {
    QString text;
    QList<QTextLayout::FormatRange> formats;
    QTextBlockFormat blockFormat;
    QTextCharFormat blockCharFormat;
    std::optional<Projection::ListMarkerInfo> marker;
    int markerLength = 0;           // inline marker characters at the start
    QList<Decoration> decorations;
    QList<RenderedRun> runs;
};

struct BlockOffset {
    QString blockId;
    int markerStart = 0;    // block start in the view, before any inline marker
    int viewStart = 0;      // first content character
    int viewEnd = 0;
    int modelStart = 0;
    int modelEnd = 0;
    int delta = 0;          // viewStart - modelStart
};

struct RenderResult {
    std::unique_ptr<QTextDocument> document;
    QList<Projection::ListMarkerInfo> markers;
    QList<BlockOffset> blockOffsets;
    QList<RenderedRun> runs;
    DecorationRegistry decorations;

    // View text with U+2029 between blocks
    QString viewText() const;
    int viewLength() const;
    IndexMapper mapper() const;

    const BlockOffset *blockAt(int viewOffset) const;
    const RenderedRun *runAt(int viewOffset) const;
};

class ProjectionRenderer {
public:
    ProjectionRenderer();
    explicit ProjectionRenderer(const RenderStyle &style,
                                ComposerSettings::ListDecoration listDecoration
                                = ComposerSettings::ListDecoration::Gutter);

    void setStyle(const RenderStyle &style) { m_style = style; }
    const RenderStyle &style() const { return m_style; }

    void setListDecoration(ComposerSettings::ListDecoration mode);
    ComposerSettings::ListDecoration listDecoration() const { return m_listStrategy->mode(); }

    // Not owned; may be null, in which case mentions render as plain links
    void setMentionDisplayHandler(MentionDisplayHandler *handler) { m_mentionHandler = handler; }

    // A single block on its own; ordered list items are numbered 1
    StyledFragment renderBlock(const Projection::BlockProjection &block) const;

    RenderResult render(const QList<Projection::BlockProjection> &blocks) const;

private:
    StyledFragment buildFragment(const Projection::BlockProjection &block,
                                 const QString &markerText, int leadingPad) const;
    QString mentionText(const Projection::MentionRun &mention, QTextCharFormat &cf) const;

    RenderStyle m_style;
    std::unique_ptr<ListDecorationStrategy> m_listStrategy;
    MentionDisplayHandler *m_mentionHandler = nullptr;
};

#endif // RICHCOMPOSER_PROJECTIONRENDERER_H
