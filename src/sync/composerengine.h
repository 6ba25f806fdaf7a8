/*
 * composerengine.h — Interface to the external document engine
 *
 * The engine owns the document: block structure, edit semantics, undo
 * history and markup conversion. Calls are synchronous and must not be
 * reentered. A failing call throws ComposerEngineError.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_COMPOSERENGINE_H
#define RICHCOMPOSER_COMPOSERENGINE_H

#include "composerintent.h"
#include "projectionmodel.h"

#include <stdexcept>

class ComposerEngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ComposerEngine {
public:
    virtual ~ComposerEngine() = default;

    // Editing
    virtual Projection::ComposerUpdate replaceText(const QString &text) = 0;
    virtual Projection::ComposerUpdate replaceTextIn(const QString &text, int start, int end) = 0;
    virtual Projection::ComposerUpdate enter() = 0;
    virtual Projection::ComposerUpdate backspace() = 0;
    virtual Projection::ComposerUpdate deleteIn(int start, int end) = 0;
    virtual Projection::ComposerUpdate clear() = 0;

    // Formatting and structure
    virtual Projection::ComposerUpdate format(InlineFormat format) = 0;
    virtual Projection::ComposerUpdate toggleList(bool ordered) = 0;
    virtual Projection::ComposerUpdate codeBlock() = 0;
    virtual Projection::ComposerUpdate quote() = 0;
    virtual Projection::ComposerUpdate indent() = 0;
    virtual Projection::ComposerUpdate unindent() = 0;

    // History
    virtual Projection::ComposerUpdate undo() = 0;
    virtual Projection::ComposerUpdate redo() = 0;

    // Links
    virtual Projection::ComposerUpdate setLink(const QString &url) = 0;
    virtual Projection::ComposerUpdate removeLinks() = 0;
    virtual Projection::ComposerUpdate setLinkWithText(const QString &url, const QString &text) = 0;

    virtual Projection::ComposerUpdate select(int start, int end) = 0;
    virtual Projection::ComposerUpdate setContentFromHtml(const QString &html) = 0;

    // Suggestions
    virtual Projection::ComposerUpdate replaceTextSuggestion(
        const QString &text, const Projection::SuggestionPattern &pattern) = 0;
    virtual Projection::ComposerUpdate insertMentionAtSuggestion(
        const QString &url, const QString &text, const Projection::SuggestionPattern &pattern) = 0;
    virtual Projection::ComposerUpdate insertAtRoomMentionAtSuggestion(
        const Projection::SuggestionPattern &pattern) = 0;

    virtual QList<Projection::BlockProjection> blockProjections() const = 0;
};

#endif // RICHCOMPOSER_COMPOSERENGINE_H
