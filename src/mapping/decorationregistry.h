/*
 * decorationregistry.h — Ordered view-only spans produced by the renderer
 *
 * A decoration is a run of view characters with no model counterpart:
 * block separators between abutting blocks, inline list markers and the
 * surplus characters of mentions whose display text is longer than the
 * model run.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_DECORATIONREGISTRY_H
#define RICHCOMPOSER_DECORATIONREGISTRY_H

#include <QList>
#include <QString>

struct Decoration {
    // Which side a model offset equal to the decoration start lands on
    enum class Placement {
        BoundaryBefore,     // separators: offset stays before the span
        BoundaryAfter       // markers, run surplus: offset moves past it
    };

    enum class Kind {
        Separator,
        ListMarker,
        RunSurplus      // display text longer than the run's model range
    };

    int viewStart = 0;
    int length = 0;
    Placement placement = Placement::BoundaryBefore;
    Kind kind = Kind::Separator;

    int viewEnd() const { return viewStart + length; }

    bool operator==(const Decoration &o) const
    {
        return viewStart == o.viewStart && length == o.length
            && placement == o.placement && kind == o.kind;
    }
};

class DecorationRegistry {
public:
    DecorationRegistry() = default;

    // Spans must arrive in view order and must not overlap; an offending
    // span is rejected and logged.
    bool add(const Decoration &decoration);
    bool add(int viewStart, int length, Decoration::Placement placement,
             Decoration::Kind kind);

    void clear();

    const QList<Decoration> &decorations() const { return m_decorations; }
    bool isEmpty() const { return m_decorations.isEmpty(); }
    int count() const { return m_decorations.size(); }
    int totalLength() const { return m_totalLength; }

    // Decoration containing viewOffset (start inclusive, end exclusive)
    const Decoration *decorationAt(int viewOffset) const;

    static QString kindName(Decoration::Kind kind);

private:
    QList<Decoration> m_decorations;
    int m_totalLength = 0;
};

#endif // RICHCOMPOSER_DECORATIONREGISTRY_H
