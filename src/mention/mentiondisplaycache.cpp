/*
 * mentiondisplaycache.cpp — Session-scoped memo over a MentionDisplayHandler
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "mentiondisplaycache.h"

#include <QDebug>

MentionDisplayCache::MentionDisplayCache(MentionDisplayHandler *delegate)
    : m_delegate(delegate)
{
}

MentionDisplay MentionDisplayCache::resolveMentionDisplay(const QString &text,
                                                          const QString &url)
{
    if (!m_delegate)
        return PlainDisplay{};

    const QPair<QString, QString> key(text, url);
    auto it = m_entries.constFind(key);
    if (it != m_entries.constEnd()) {
        ++m_hits;
        return it.value();
    }

    ++m_misses;
    const MentionDisplay display = m_delegate->resolveMentionDisplay(text, url);
    m_entries.insert(key, display);
    return display;
}

MentionDisplay MentionDisplayCache::resolveAtRoomMentionDisplay()
{
    if (!m_delegate)
        return PlainDisplay{};

    if (m_atRoom) {
        ++m_hits;
        return *m_atRoom;
    }

    ++m_misses;
    m_atRoom = m_delegate->resolveAtRoomMentionDisplay();
    return *m_atRoom;
}

void MentionDisplayCache::setDelegate(MentionDisplayHandler *delegate)
{
    if (m_delegate == delegate)
        return;
    clear();
    m_delegate = delegate;
}

void MentionDisplayCache::clear()
{
    if (m_hits || m_misses)
        qDebug() << "MentionDisplayCache: clearing" << size() << "entries,"
                 << m_hits << "hits" << m_misses << "misses";
    m_entries.clear();
    m_atRoom.reset();
    m_hits = 0;
    m_misses = 0;
}
