/*
 * documentviewhost.cpp — TextViewHost over a QTextDocument
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentviewhost.h"
#include "stringdiffer.h"

#include <QDebug>
#include <QTextBlock>
#include <QTextCursor>
#include <QTextLayout>

DocumentViewHost::DocumentViewHost()
    : m_ownedDocument(std::make_unique<QTextDocument>())
    , m_document(m_ownedDocument.get())
{
    m_document->setUndoRedoEnabled(false);
}

DocumentViewHost::DocumentViewHost(QTextDocument *document)
    : m_document(document)
{
    m_document->setUndoRedoEnabled(false);
}

QString DocumentViewHost::text() const
{
    return m_document->toRawText();
}

int DocumentViewHost::length() const
{
    return m_document->characterCount() - 1;
}

bool DocumentViewHost::replaceRange(int location, int length, const QString &text)
{
    if (location < 0 || length < 0 || location + length > this->length()) {
        qWarning() << "DocumentViewHost: replacement" << location << length
                   << "outside document of length" << this->length();
        return false;
    }

    QTextCursor cursor(m_document);
    cursor.setPosition(location);
    cursor.setPosition(location + length, QTextCursor::KeepAnchor);
    // U+2029 in the text opens a new block; formats are fixed by syncFormats()
    if (text.isEmpty())
        cursor.removeSelectedText();
    else
        cursor.insertText(text);
    ++m_patchCount;
    return true;
}

bool DocumentViewHost::syncFormats(const QTextDocument &rendered)
{
    if (m_document->blockCount() != rendered.blockCount())
        return false;

    QTextBlock hostBlock = m_document->begin();
    for (QTextBlock block = rendered.begin(); block.isValid();
         block = block.next(), hostBlock = hostBlock.next()) {
        // Whitespace kinds may differ after a whitespace-insensitive diff
        if (!StringDiffer::isEquivalent(hostBlock.text(), block.text()))
            return false;

        QTextCursor cursor(hostBlock);
        if (hostBlock.blockFormat() != block.blockFormat())
            cursor.setBlockFormat(block.blockFormat());
        if (hostBlock.charFormat() != block.charFormat())
            cursor.setBlockCharFormat(block.charFormat());

        const QList<QTextLayout::FormatRange> formats = block.textFormats();
        if (hostBlock.textFormats() == formats)
            continue;
        for (const QTextLayout::FormatRange &range : formats) {
            cursor.setPosition(hostBlock.position() + range.start);
            cursor.setPosition(hostBlock.position() + range.start + range.length,
                               QTextCursor::KeepAnchor);
            cursor.setCharFormat(range.format);
        }
    }
    return true;
}

void DocumentViewHost::replaceAll(const QTextDocument &rendered)
{
    m_document->clear();
    m_document->setDefaultFont(rendered.defaultFont());

    QTextCursor cursor(m_document);
    bool isFirstBlock = true;
    for (QTextBlock block = rendered.begin(); block.isValid(); block = block.next()) {
        if (isFirstBlock) {
            cursor.setBlockFormat(block.blockFormat());
            cursor.setBlockCharFormat(block.charFormat());
            isFirstBlock = false;
        } else {
            cursor.insertBlock(block.blockFormat(), block.charFormat());
        }
        const QString text = block.text();
        const QList<QTextLayout::FormatRange> formats = block.textFormats();
        for (const QTextLayout::FormatRange &range : formats)
            cursor.insertText(text.mid(range.start, range.length), range.format);
    }
    ++m_fullReplaceCount;
}

void DocumentViewHost::setSelection(int start, int end)
{
    const int max = length();
    m_selection = {qBound(0, start, max), qBound(0, end, max)};
}

void DocumentViewHost::setListMarkers(const QList<Projection::ListMarkerInfo> &markers)
{
    m_markers = markers;
}
