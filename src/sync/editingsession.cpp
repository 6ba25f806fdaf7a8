/*
 * editingsession.cpp — State that lives for one composer session
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "editingsession.h"

#include <QDebug>

using namespace Projection;

EditingSession::EditingSession(MentionDisplayHandler *mentionHandler)
    : m_mentionCache(mentionHandler)
{
}

void EditingSession::open()
{
    if (m_open)
        close();
    m_open = true;
}

void EditingSession::close()
{
    if (!m_open)
        return;
    qDebug() << "EditingSession: closing with" << m_actionStates.size() << "action states,"
             << m_mentionCache.size() << "cached mentions";
    m_actionStates.clear();
    m_mentionCache.clear();
    m_mapper = IndexMapper();
    m_suggestionPattern.reset();
    m_selection = {};
    m_plainText.clear();
    m_open = false;
}

ActionState EditingSession::actionState(ComposerAction action) const
{
    // Nothing is actionable before the engine has reported
    return m_actionStates.value(action, ActionState::Disabled);
}

void EditingSession::mergeMenuState(const MenuStateUpdate &update)
{
    for (auto it = update.cbegin(); it != update.cend(); ++it)
        m_actionStates.insert(it.key(), it.value());
}

void EditingSession::setSuggestionPattern(const SuggestionPattern &pattern)
{
    m_suggestionPattern = pattern;
}
