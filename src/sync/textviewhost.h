/*
 * textviewhost.h — The native text view SyncController writes into
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_TEXTVIEWHOST_H
#define RICHCOMPOSER_TEXTVIEWHOST_H

#include "projectionmodel.h"

class QTextDocument;

class TextViewHost {
public:
    virtual ~TextViewHost() = default;

    // Raw view text, U+2029 between blocks
    virtual QString text() const = 0;
    virtual int length() const = 0;

    // Hosts that can take in-place edits get StringDiffer patches followed
    // by a format pass; the rest always receive whole documents.
    virtual bool supportsPatching() const = 0;
    virtual bool replaceRange(int location, int length, const QString &text) = 0;
    // Copies block and character formats from a document with the same text.
    // Returns false when the structure differs.
    virtual bool syncFormats(const QTextDocument &rendered) = 0;

    virtual void replaceAll(const QTextDocument &rendered) = 0;

    virtual void setSelection(int start, int end) = 0;
    virtual Projection::TextRange selection() const = 0;

    virtual void setListMarkers(const QList<Projection::ListMarkerInfo> &markers) = 0;
};

#endif // RICHCOMPOSER_TEXTVIEWHOST_H
