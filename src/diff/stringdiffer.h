/*
 * stringdiffer.h — Single-region text replacement between two snapshots
 *
 * Works on UTF-16 code units so locations are directly usable as model
 * and QTextDocument positions. Whitespace code points are treated as
 * interchangeable when deciding whether anything changed.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_STRINGDIFFER_H
#define RICHCOMPOSER_STRINGDIFFER_H

#include <QList>
#include <QString>

#include <optional>

struct StringReplacement {
    int location = 0;
    int length = 0;
    QString text;
    // The difference is made of several disjoint edits; apply this one and
    // diff again to get the next.
    bool hasMore = false;

    bool operator==(const StringReplacement &o) const
    {
        return location == o.location && length == o.length
            && text == o.text && hasMore == o.hasMore;
    }
    bool operator!=(const StringReplacement &o) const { return !(*this == o); }
};

class StringDiffer
{
public:
    StringDiffer() = delete;

    // Replacement turning oldText into newText, first edit only when the
    // difference is not contiguous. nullopt when both are equivalent.
    static std::optional<StringReplacement> replacement(const QString &oldText,
                                                        const QString &newText);

    // Every replacement needed to reconcile oldText into newText, in
    // application order. nullopt when more than maxIterations would be
    // needed; callers then replace the full range instead.
    static std::optional<QList<StringReplacement>> patchSequence(const QString &oldText,
                                                                 const QString &newText,
                                                                 int maxIterations);

    static StringReplacement fullReplacement(const QString &oldText, const QString &newText);

    static QString apply(const QString &text, const StringReplacement &replacement);

    // Equal once every whitespace code point is folded to U+00A0
    static bool isEquivalent(const QString &a, const QString &b);
    static QString foldWhitespace(const QString &text);
};

#endif // RICHCOMPOSER_STRINGDIFFER_H
