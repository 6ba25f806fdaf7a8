/*
 * projectionrenderer.cpp — Block/run projections to a styled QTextDocument
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "projectionrenderer.h"
#include "mentiondisplay.h"
#include "mentionurl.h"

#include <QDebug>
#include <QTextCursor>

#include <type_traits>
#include <variant>

using namespace Projection;

static constexpr QChar kLineSeparator(0x2028);
static constexpr QChar kObjectReplacement(0xFFFC);

namespace {

// Characters that would make QTextCursor::insertText() open a new block
QString keepInBlock(const QString &text)
{
    QString result = text;
    for (QChar &c : result) {
        const ushort u = c.unicode();
        if (u == '\n' || u == '\r' || u == QChar::ParagraphSeparator
            || u == 0xFDD0 || u == 0xFDD1) {
            c = kLineSeparator;
        }
    }
    return result;
}

// Consecutive quotes, or blocks inside the same quote, draw as one box
bool sharesQuoteContainer(const BlockProjection &a, const BlockProjection &b)
{
    if (a.kind.type == BlockType::Quote && b.kind.type == BlockType::Quote)
        return true;
    return a.inQuote && b.inQuote;
}

} // anonymous namespace

// --- RenderResult ---

QString RenderResult::viewText() const
{
    return document ? document->toRawText() : QString();
}

int RenderResult::viewLength() const
{
    // characterCount() includes the final paragraph separator
    return document ? document->characterCount() - 1 : 0;
}

IndexMapper RenderResult::mapper() const
{
    return IndexMapper(decorations, viewLength());
}

const BlockOffset *RenderResult::blockAt(int viewOffset) const
{
    for (const BlockOffset &offset : blockOffsets) {
        if (viewOffset >= offset.markerStart && viewOffset <= offset.viewEnd)
            return &offset;
    }
    return nullptr;
}

const RenderedRun *RenderResult::runAt(int viewOffset) const
{
    for (const RenderedRun &run : runs) {
        if (viewOffset >= run.viewStart && viewOffset < run.viewEnd)
            return &run;
    }
    return nullptr;
}

// --- ProjectionRenderer ---

ProjectionRenderer::ProjectionRenderer()
    : ProjectionRenderer(RenderStyle())
{
}

ProjectionRenderer::ProjectionRenderer(const RenderStyle &style,
                                       ComposerSettings::ListDecoration listDecoration)
    : m_style(style)
    , m_listStrategy(ListDecorationStrategy::create(listDecoration))
{
}

void ProjectionRenderer::setListDecoration(ComposerSettings::ListDecoration mode)
{
    if (m_listStrategy->mode() != mode)
        m_listStrategy = ListDecorationStrategy::create(mode);
}

QString ProjectionRenderer::mentionText(const MentionRun &mention, QTextCharFormat &cf) const
{
    const bool atRoom = MentionUrl::parse(mention.url).isAtRoom();

    MentionDisplay display = PlainDisplay{};
    if (m_mentionHandler) {
        display = atRoom ? m_mentionHandler->resolveAtRoomMentionDisplay()
                         : m_mentionHandler->resolveMentionDisplay(mention.displayText,
                                                                   mention.url);
    }

    QString text = mention.displayText;
    if (text.isEmpty() && atRoom)
        text = QStringLiteral("@room");

    std::visit([&](const auto &d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, PillDisplay>) {
            cf.setAnchor(true);
            cf.setAnchorHref(mention.url);
            cf.setBackground(m_style.pillBackground);
        } else if constexpr (std::is_same_v<T, CustomDisplay>) {
            text = d.text;
            cf.setAnchor(true);
            cf.setAnchorHref(mention.url);
        } else {
            m_style.applyLink(cf, mention.url);
        }
    }, display);

    cf.setProperty(MentionUrlProperty, mention.url);
    return keepInBlock(text);
}

StyledFragment ProjectionRenderer::renderBlock(const BlockProjection &block) const
{
    ListOrdinalCounter counter;
    return buildFragment(block, counter.next(block.kind), 0);
}

StyledFragment ProjectionRenderer::buildFragment(const BlockProjection &block,
                                                 const QString &markerText,
                                                 int leadingPad) const
{
    StyledFragment fragment;
    const bool isCode = block.kind.type == BlockType::CodeBlock;
    const bool isQuote = block.kind.type == BlockType::Quote || block.inQuote;

    // Block format
    QTextBlockFormat bf;
    if (block.kind.isList()) {
        bf = m_style.listItemBlockFormat(block.kind.depth, block.inQuote);
    } else if (isCode) {
        bf = m_style.codeBlockBlockFormat();
        if (block.inQuote) {
            bf.setProperty(QTextFormat::BlockQuoteLevel, 1);
            bf.setLeftMargin(m_style.quoteIndent);
        }
    } else if (isQuote) {
        bf = m_style.blockQuoteBlockFormat(1);
    } else {
        bf = m_style.bodyBlockFormat();
    }
    bf.setProperty(BlockIdProperty, block.blockId);
    fragment.blockFormat = bf;

    const QTextCharFormat base = isCode ? m_style.codeBlockCharFormat()
                                        : m_style.bodyCharFormat();
    fragment.blockCharFormat = base;

    auto append = [&fragment](const QString &text, const QTextCharFormat &cf) {
        if (text.isEmpty())
            return;
        QTextLayout::FormatRange range;
        range.start = fragment.text.size();
        range.length = text.size();
        range.format = cf;
        fragment.formats.append(range);
        fragment.text += text;
    };
    auto pad = [&](int count) {
        if (count > 0)
            append(QString(count, kObjectReplacement), base);
    };

    // List marker
    if (block.kind.isList()) {
        ListMarkerInfo marker;
        marker.text = markerText;
        marker.font = m_style.bodyFont;
        marker.color = m_style.markerColor;
        marker.headIndent = m_style.listHeadIndent(block.kind.depth, block.inQuote);

        const QString inlineMarker = m_listStrategy->inlineText(marker);
        if (!inlineMarker.isEmpty()) {
            QTextCharFormat mf = base;
            mf.setForeground(marker.color);
            append(inlineMarker, mf);
            fragment.markerLength = inlineMarker.size();
            fragment.decorations.append(Decoration{0, fragment.markerLength,
                                                   Decoration::Placement::BoundaryAfter,
                                                   Decoration::Kind::ListMarker});
        }
        fragment.marker = marker;
    }

    pad(leadingPad);

    // Inline runs
    int model = block.startUtf16;
    for (int i = 0; i < block.inlineRuns.size(); ++i) {
        const InlineRun &run = block.inlineRuns.at(i);
        if (run.startUtf16 > model)
            pad(run.startUtf16 - model);

        QTextCharFormat cf = base;
        QString text = std::visit([&](const auto &kind) -> QString {
            using T = std::decay_t<decltype(kind)>;
            if constexpr (std::is_same_v<T, TextRun>) {
                m_style.applyAttributes(cf, kind.attributes);
                return keepInBlock(kind.text);
            } else if constexpr (std::is_same_v<T, MentionRun>) {
                return mentionText(kind, cf);
            } else {
                return QString(kLineSeparator);
            }
        }, run.kind);

        // Every model unit of the run gets exactly one view character
        const int length = qMax(0, run.length());
        if (text.size() < length)
            text += QString(length - text.size(), kObjectReplacement);

        const int viewStart = fragment.text.size();
        append(text, cf);
        if (text.size() > length) {
            fragment.decorations.append(Decoration{viewStart + length,
                                                   static_cast<int>(text.size()) - length,
                                                   Decoration::Placement::BoundaryAfter,
                                                   Decoration::Kind::RunSurplus});
        }

        RenderedRun rendered;
        rendered.runIndex = i;
        rendered.nodeId = run.nodeId;
        rendered.viewStart = viewStart;
        rendered.viewEnd = fragment.text.size();
        rendered.modelStart = run.startUtf16;
        rendered.modelEnd = run.endUtf16;
        fragment.runs.append(rendered);

        model = qMax(model, run.endUtf16);
    }
    if (block.endUtf16 > model)
        pad(block.endUtf16 - model);

    return fragment;
}

RenderResult ProjectionRenderer::render(const QList<BlockProjection> &blocks) const
{
    if (const auto error = validate(blocks)) {
        qWarning() << "ProjectionRenderer: invalid projection at block" << error->blockIndex
                   << "run" << error->runIndex << ":" << error->message;
    }

    RenderResult result;
    result.document = std::make_unique<QTextDocument>();
    QTextDocument *doc = result.document.get();
    doc->setUndoRedoEnabled(false);
    doc->setDefaultFont(m_style.bodyFont);

    QTextCursor cursor(doc);
    ListOrdinalCounter counter;
    int view = 0;
    int model = 0;
    bool isFirstBlock = true;

    for (int b = 0; b < blocks.size(); ++b) {
        const BlockProjection &block = blocks.at(b);

        int leadingPad = 0;
        if (isFirstBlock) {
            leadingPad = block.startUtf16 - model;
        } else {
            // The paragraph separator either covers the model unit reserved
            // between blocks or is view-only
            if (block.startUtf16 > model) {
                ++model;
            } else {
                result.decorations.add(view, 1, Decoration::Placement::BoundaryBefore,
                                       Decoration::Kind::Separator);
            }
            ++view;
            leadingPad = block.startUtf16 - model;
        }
        leadingPad = qMax(0, leadingPad);

        StyledFragment fragment = buildFragment(block, counter.next(block.kind), leadingPad);
        const bool continuesQuote = !isFirstBlock && sharesQuoteContainer(blocks.at(b - 1), block);
        if (continuesQuote)
            fragment.blockFormat.setTopMargin(0);

        if (isFirstBlock) {
            cursor.setBlockFormat(fragment.blockFormat);
            cursor.setBlockCharFormat(fragment.blockCharFormat);
            isFirstBlock = false;
        } else {
            if (continuesQuote) {
                QTextBlockFormat previous = cursor.blockFormat();
                previous.setBottomMargin(0);
                cursor.setBlockFormat(previous);
            }
            cursor.insertBlock(fragment.blockFormat, fragment.blockCharFormat);
        }
        for (const QTextLayout::FormatRange &range : fragment.formats)
            cursor.insertText(fragment.text.mid(range.start, range.length), range.format);

        if (fragment.marker) {
            ListMarkerInfo marker = *fragment.marker;
            marker.characterIndex = view;
            result.markers.append(marker);
        }

        for (Decoration decoration : fragment.decorations) {
            decoration.viewStart += view;
            result.decorations.add(decoration);
        }

        for (RenderedRun run : fragment.runs) {
            run.blockIndex = b;
            run.viewStart += view;
            run.viewEnd += view;
            result.runs.append(run);
        }

        BlockOffset offset;
        offset.blockId = block.blockId;
        offset.markerStart = view;
        offset.viewStart = view + fragment.markerLength + leadingPad;
        offset.viewEnd = view + fragment.text.size();
        offset.modelStart = block.startUtf16;
        offset.modelEnd = block.endUtf16;
        offset.delta = offset.viewStart - offset.modelStart;
        result.blockOffsets.append(offset);

        view += fragment.text.size();
        model = qMax(model, block.endUtf16);
    }

    if (view != result.viewLength()) {
        qWarning() << "ProjectionRenderer: document length" << result.viewLength()
                   << "differs from rendered length" << view;
    }
    return result;
}
