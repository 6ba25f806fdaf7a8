/*
 * documentviewhost.h — TextViewHost over a QTextDocument
 *
 * Used by text widgets that display a QTextDocument (QTextEdit, a
 * QQuickTextDocument) and by the tests. Undo/redo is disabled on the
 * document: the engine owns history.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_DOCUMENTVIEWHOST_H
#define RICHCOMPOSER_DOCUMENTVIEWHOST_H

#include "textviewhost.h"

#include <QTextDocument>

#include <memory>

class DocumentViewHost : public TextViewHost {
public:
    // Creates and owns its own document
    DocumentViewHost();
    // Writes into an external document, which must outlive the host
    explicit DocumentViewHost(QTextDocument *document);

    QTextDocument *document() const { return m_document; }

    QString text() const override;
    int length() const override;

    bool supportsPatching() const override { return m_patchingEnabled; }
    void setPatchingEnabled(bool enabled) { m_patchingEnabled = enabled; }

    bool replaceRange(int location, int length, const QString &text) override;
    bool syncFormats(const QTextDocument &rendered) override;
    void replaceAll(const QTextDocument &rendered) override;

    void setSelection(int start, int end) override;
    Projection::TextRange selection() const override { return m_selection; }

    void setListMarkers(const QList<Projection::ListMarkerInfo> &markers) override;
    const QList<Projection::ListMarkerInfo> &listMarkers() const { return m_markers; }

    // Counters for callers that care how the last updates were applied
    int patchCount() const { return m_patchCount; }
    int fullReplaceCount() const { return m_fullReplaceCount; }

private:
    std::unique_ptr<QTextDocument> m_ownedDocument;
    QTextDocument *m_document = nullptr;
    Projection::TextRange m_selection;
    QList<Projection::ListMarkerInfo> m_markers;
    bool m_patchingEnabled = true;
    int m_patchCount = 0;
    int m_fullReplaceCount = 0;
};

#endif // RICHCOMPOSER_DOCUMENTVIEWHOST_H
