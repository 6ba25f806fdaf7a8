/*
 * projectionjson.h — JSON form of projections and snapshots
 *
 * {"blocks": [{"id", "kind", "depth", "inQuote", "start", "end",
 *              "runs": [{"id", "type", "start", "end", "text", "bold", ...,
 *                        "link", "url", "displayText"}]}],
 *  "selection": {"start", "end"},
 *  "menuState": {"bold": "reversed", ...}}
 *
 * kind is one of paragraph, codeBlock, quote, generic, orderedList,
 * unorderedList; run type is text, mention or lineBreak. A run's "end"
 * may be omitted and defaults to the length of its text (one unit for
 * mentions and line breaks); a block's "end" defaults to its last run's end.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_PROJECTIONJSON_H
#define RICHCOMPOSER_PROJECTIONJSON_H

#include "projectionmodel.h"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>

namespace ProjectionJson {

std::optional<Projection::Snapshot> readSnapshot(const QByteArray &json,
                                                 QString *errorMessage = nullptr);
QByteArray writeSnapshot(const Projection::Snapshot &snapshot);

std::optional<QList<Projection::BlockProjection>> blocksFromJson(const QJsonArray &array,
                                                                 QString *errorMessage);
QJsonArray blocksToJson(const QList<Projection::BlockProjection> &blocks);

QString actionName(Projection::ComposerAction action);
std::optional<Projection::ComposerAction> actionFromName(const QString &name);
QString actionStateName(Projection::ActionState state);
std::optional<Projection::ActionState> actionStateFromName(const QString &name);

} // namespace ProjectionJson

#endif // RICHCOMPOSER_PROJECTIONJSON_H
