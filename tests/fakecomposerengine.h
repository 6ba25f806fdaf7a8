/*
 * fakecomposerengine.h — Scripted ComposerEngine for controller tests
 *
 * Keeps a flat model string with '\n' between paragraphs. Bold is the only
 * inline format it tracks; mentions occupy one code unit each.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_FAKECOMPOSERENGINE_H
#define RICHCOMPOSER_FAKECOMPOSERENGINE_H

#include "composerengine.h"

#include <functional>
#include <optional>

class FakeComposerEngine : public ComposerEngine {
public:
    Projection::ComposerUpdate replaceText(const QString &text) override;
    Projection::ComposerUpdate replaceTextIn(const QString &text, int start, int end) override;
    Projection::ComposerUpdate enter() override;
    Projection::ComposerUpdate backspace() override;
    Projection::ComposerUpdate deleteIn(int start, int end) override;
    Projection::ComposerUpdate clear() override;

    Projection::ComposerUpdate format(InlineFormat format) override;
    Projection::ComposerUpdate toggleList(bool ordered) override;
    Projection::ComposerUpdate codeBlock() override;
    Projection::ComposerUpdate quote() override;
    Projection::ComposerUpdate indent() override;
    Projection::ComposerUpdate unindent() override;

    Projection::ComposerUpdate undo() override;
    Projection::ComposerUpdate redo() override;

    Projection::ComposerUpdate setLink(const QString &url) override;
    Projection::ComposerUpdate removeLinks() override;
    Projection::ComposerUpdate setLinkWithText(const QString &url, const QString &text) override;

    Projection::ComposerUpdate select(int start, int end) override;
    Projection::ComposerUpdate setContentFromHtml(const QString &html) override;

    Projection::ComposerUpdate replaceTextSuggestion(
        const QString &text, const Projection::SuggestionPattern &pattern) override;
    Projection::ComposerUpdate insertMentionAtSuggestion(
        const QString &url, const QString &text, const Projection::SuggestionPattern &pattern) override;
    Projection::ComposerUpdate insertAtRoomMentionAtSuggestion(
        const Projection::SuggestionPattern &pattern) override;

    QList<Projection::BlockProjection> blockProjections() const override;

    const QString &text() const { return m_text; }

    // --- Test controls ---
    bool failNext = false;
    // Throws something other than ComposerEngineError
    bool crashNext = false;
    mutable bool crashProjections = false;
    std::function<void()> onCall;
    std::optional<Projection::MenuAction> nextMenuAction;

    // --- Observations ---
    int callCount = 0;
    QString lastCall;
    Projection::TextRange selection;
    QString lastHtml;
    std::optional<Projection::SuggestionPattern> lastPattern;
    int undoCount = 0;

private:
    struct Unit {
        bool bold = false;
        QString mentionUrl;     // non-empty for mention units
        QString mentionText;
    };

    void begin(const char *name);
    void replaceRange(int start, int end, const QString &text, const Unit &unit);
    Projection::ComposerUpdate textChanged(const Projection::MenuStateUpdate &menu = {});
    Projection::ComposerUpdate finish(Projection::ComposerUpdate update);
    Projection::MenuStateUpdate boldState() const;
    Projection::BlockProjection makeBlock(int index, int start, int end) const;

    QString m_text;
    QList<Unit> m_units;
    bool m_boldActive = false;
    std::optional<Projection::ListType> m_list;
};

#endif // RICHCOMPOSER_FAKECOMPOSERENGINE_H
