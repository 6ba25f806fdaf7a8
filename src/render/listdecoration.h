/*
 * listdecoration.h — List marker strategies and ordinal counting
 *
 * A strategy decides whether a list item's marker becomes view text. The
 * gutter strategy inserts nothing and leaves drawing to the view; the inline
 * strategy inserts "1. " or "• " at the block start, which the renderer
 * registers as a decoration so model offsets are unaffected.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_LISTDECORATION_H
#define RICHCOMPOSER_LISTDECORATION_H

#include "composersettings.h"
#include "projectionmodel.h"

#include <QList>

#include <memory>

class ListDecorationStrategy {
public:
    virtual ~ListDecorationStrategy() = default;

    virtual ComposerSettings::ListDecoration mode() const = 0;

    // Text to insert before the item's content; empty inserts nothing
    virtual QString inlineText(const Projection::ListMarkerInfo &marker) const = 0;

    static std::unique_ptr<ListDecorationStrategy> create(ComposerSettings::ListDecoration mode);
};

class GutterMarkerStrategy : public ListDecorationStrategy {
public:
    ComposerSettings::ListDecoration mode() const override
    {
        return ComposerSettings::ListDecoration::Gutter;
    }
    QString inlineText(const Projection::ListMarkerInfo &) const override { return QString(); }
};

class InlineMarkerStrategy : public ListDecorationStrategy {
public:
    ComposerSettings::ListDecoration mode() const override
    {
        return ComposerSettings::ListDecoration::Inline;
    }
    QString inlineText(const Projection::ListMarkerInfo &marker) const override;
};

// Ordinals per nesting depth. A shallower item resets deeper counters and
// any non-list block resets all of them.
class ListOrdinalCounter {
public:
    // Marker text for the next item of the given kind: "N." or a bullet
    QString next(const Projection::BlockKind &kind);
    void reset() { m_counters.clear(); }

private:
    QList<int> m_counters;  // index = depth - 1
};

#endif // RICHCOMPOSER_LISTDECORATION_H
