/*
 * mentionurl.h — Classify mention permalinks
 *
 * Mentions link to scheme://host/#/<sigil><identifier>, where the sigil is
 * '@' for users, '#' for room aliases, '!' for room ids and '/' for slash
 * commands. The reserved at-room mention uses the bare url "@room".
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_MENTIONURL_H
#define RICHCOMPOSER_MENTIONURL_H

#include "projectionmodel.h"

#include <QSet>
#include <QString>

struct MentionUrl {
    enum class Kind {
        User,
        RoomAlias,
        RoomId,
        SlashCommand,
        AtRoom,
        Unknown
    };

    Kind kind = Kind::Unknown;
    QString identifier;     // sigil included, e.g. "@alice:example.org"

    bool isAtRoom() const { return kind == Kind::AtRoom; }

    static MentionUrl parse(const QString &url);
};

// Mentions present in a document, grouped by target
struct MentionsState {
    QSet<QString> userIds;
    QSet<QString> roomIds;
    QSet<QString> roomAliases;
    bool hasAtRoomMention = false;

    static MentionsState collect(const QList<Projection::BlockProjection> &blocks);
};

#endif // RICHCOMPOSER_MENTIONURL_H
