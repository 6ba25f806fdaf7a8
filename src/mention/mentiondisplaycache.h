/*
 * mentiondisplaycache.h — Session-scoped memo over a MentionDisplayHandler
 *
 * Entries are never evicted; the owning session clears the cache when it
 * closes. Two caches are equal when they wrap the same delegate object.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_MENTIONDISPLAYCACHE_H
#define RICHCOMPOSER_MENTIONDISPLAYCACHE_H

#include "mentiondisplay.h"

#include <QHash>
#include <QPair>

#include <optional>

class MentionDisplayCache : public MentionDisplayHandler {
public:
    explicit MentionDisplayCache(MentionDisplayHandler *delegate = nullptr);

    MentionDisplay resolveMentionDisplay(const QString &text, const QString &url) override;
    MentionDisplay resolveAtRoomMentionDisplay() override;

    // Swapping to a different delegate drops every cached answer
    void setDelegate(MentionDisplayHandler *delegate);
    MentionDisplayHandler *delegate() const { return m_delegate; }
    bool delegateEquals(const MentionDisplayHandler *other) const { return m_delegate == other; }

    void clear();

    int size() const { return m_entries.size() + (m_atRoom ? 1 : 0); }
    int hits() const { return m_hits; }
    int misses() const { return m_misses; }

    bool operator==(const MentionDisplayCache &o) const { return m_delegate == o.m_delegate; }
    bool operator!=(const MentionDisplayCache &o) const { return !(*this == o); }

private:
    MentionDisplayHandler *m_delegate = nullptr;
    QHash<QPair<QString, QString>, MentionDisplay> m_entries;   // (text, url)
    std::optional<MentionDisplay> m_atRoom;
    int m_hits = 0;
    int m_misses = 0;
};

#endif // RICHCOMPOSER_MENTIONDISPLAYCACHE_H
