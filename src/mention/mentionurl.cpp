/*
 * mentionurl.cpp — Classify mention permalinks
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "mentionurl.h"

#include <QUrl>

#include <variant>

MentionUrl MentionUrl::parse(const QString &url)
{
    MentionUrl result;
    if (url == QLatin1String("@room")) {
        result.kind = Kind::AtRoom;
        result.identifier = url;
        return result;
    }

    QString target;
    const QUrl parsed(url);
    if (parsed.isValid() && !parsed.scheme().isEmpty())
        target = parsed.fragment(QUrl::FullyDecoded);
    else
        target = url;   // bare identifier such as "@alice:example.org"

    if (target.startsWith(QLatin1Char('/')))
        target.remove(0, 1);
    // Permalinks may carry routing hints after the identifier
    const int query = target.indexOf(QLatin1Char('?'));
    if (query >= 0)
        target.truncate(query);
    if (target.size() < 2)
        return result;

    result.identifier = target;
    switch (target.at(0).unicode()) {
    case '@':
        result.kind = target == QLatin1String("@room") ? Kind::AtRoom : Kind::User;
        break;
    case '#':
        result.kind = Kind::RoomAlias;
        break;
    case '!':
        result.kind = Kind::RoomId;
        break;
    case '/':
        result.kind = Kind::SlashCommand;
        break;
    default:
        result.identifier.clear();
        break;
    }
    return result;
}

MentionsState MentionsState::collect(const QList<Projection::BlockProjection> &blocks)
{
    MentionsState state;
    for (const auto &block : blocks) {
        for (const auto &run : block.inlineRuns) {
            const auto *mention = std::get_if<Projection::MentionRun>(&run.kind);
            if (!mention)
                continue;
            const MentionUrl parsed = MentionUrl::parse(mention->url);
            switch (parsed.kind) {
            case MentionUrl::Kind::User:
                state.userIds.insert(parsed.identifier);
                break;
            case MentionUrl::Kind::RoomAlias:
                state.roomAliases.insert(parsed.identifier);
                break;
            case MentionUrl::Kind::RoomId:
                state.roomIds.insert(parsed.identifier);
                break;
            case MentionUrl::Kind::AtRoom:
                state.hasAtRoomMention = true;
                break;
            case MentionUrl::Kind::SlashCommand:
            case MentionUrl::Kind::Unknown:
                break;
            }
        }
    }
    return state;
}
