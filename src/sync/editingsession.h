/*
 * editingsession.h — State that lives for one composer session
 *
 * The action-state map and the mention display cache persist across engine
 * calls and are only cleared when the session closes. The index mapper is
 * rebuilt after every render.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_EDITINGSESSION_H
#define RICHCOMPOSER_EDITINGSESSION_H

#include "indexmapper.h"
#include "mentiondisplaycache.h"
#include "projectionmodel.h"

#include <optional>

class EditingSession {
public:
    explicit EditingSession(MentionDisplayHandler *mentionHandler = nullptr);

    void open();
    void close();
    bool isOpen() const { return m_open; }

    // Action states; keys absent from an update keep their value
    const Projection::MenuStateUpdate &actionStates() const { return m_actionStates; }
    Projection::ActionState actionState(Projection::ComposerAction action) const;
    void mergeMenuState(const Projection::MenuStateUpdate &update);

    MentionDisplayCache &mentionCache() { return m_mentionCache; }
    const MentionDisplayCache &mentionCache() const { return m_mentionCache; }

    const IndexMapper &mapper() const { return m_mapper; }
    void setMapper(const IndexMapper &mapper) { m_mapper = mapper; }
    void invalidateMapper() { m_mapper.invalidate(); }

    const std::optional<Projection::SuggestionPattern> &suggestionPattern() const
    {
        return m_suggestionPattern;
    }
    void setSuggestionPattern(const Projection::SuggestionPattern &pattern);
    void clearSuggestionPattern() { m_suggestionPattern.reset(); }

    // Last model selection applied to or reported by the view
    Projection::Selection selection() const { return m_selection; }
    void setSelection(const Projection::Selection &selection) { m_selection = selection; }

    // Plain text of the last replace-all update, as reported by the engine
    const QString &plainText() const { return m_plainText; }
    void setPlainText(const QString &text) { m_plainText = text; }

private:
    bool m_open = false;
    Projection::MenuStateUpdate m_actionStates;
    MentionDisplayCache m_mentionCache;
    IndexMapper m_mapper;
    std::optional<Projection::SuggestionPattern> m_suggestionPattern;
    Projection::Selection m_selection;
    QString m_plainText;
};

#endif // RICHCOMPOSER_EDITINGSESSION_H
