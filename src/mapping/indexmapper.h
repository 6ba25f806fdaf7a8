/*
 * indexmapper.h — Model <-> view offset translation over decorations
 *
 * The model counts UTF-16 code units of the engine's document. The view is
 * the rendered QTextDocument, which may carry extra characters listed in a
 * DecorationRegistry. With an empty registry both spaces are identical.
 *
 * A view position strictly inside a decoration snaps outward before it is
 * translated; decorations have no model width, so both edges of a span
 * land on the same model offset. A model offset sitting exactly at a
 * decoration's start is placed according to Decoration::Placement, except
 * for the first offset of a non-empty range: the selected text starts after
 * every decoration sitting there, so a range that begins just past a
 * separator maps back to where it began.
 *
 * The end of a range still follows the placement. A view range ending at
 * the start of a RunSurplus span comes back covering the whole span, since
 * the surplus belongs to the mention before it.
 *
 * Every call returns std::nullopt once the mapper is stale or the input is
 * out of range. Callers drop the operation and request a full re-sync.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_INDEXMAPPER_H
#define RICHCOMPOSER_INDEXMAPPER_H

#include "decorationregistry.h"
#include "projectionmodel.h"

#include <optional>

class IndexMapper {
public:
    // Identity mapper over an empty view; invalid until rebuilt
    IndexMapper() = default;
    IndexMapper(const DecorationRegistry &registry, int viewLength);

    std::optional<Projection::TextRange> toModel(const Projection::TextRange &viewRange) const;
    std::optional<Projection::TextRange> toView(const Projection::TextRange &modelRange) const;

    std::optional<int> toModelOffset(int viewOffset) const;
    std::optional<int> toViewOffset(int modelOffset) const;

    // Marks the mapper stale, e.g. after the view was edited outside the
    // controller. Only a rebuild makes it usable again.
    void invalidate() { m_valid = false; }
    bool isValid() const { return m_valid; }

    // True when the live view still has the length this mapper was built for
    bool isCompatible(int liveViewLength) const;

    int viewLength() const { return m_viewLength; }
    int modelLength() const { return m_viewLength - m_decorationLength; }
    const QList<Decoration> &decorations() const { return m_decorations; }

private:
    int mapViewOffset(int viewOffset) const;
    int mapModelOffset(int modelOffset, bool skipBoundary) const;

    QList<Decoration> m_decorations;
    int m_viewLength = 0;
    int m_decorationLength = 0;
    bool m_valid = false;
};

#endif // RICHCOMPOSER_INDEXMAPPER_H
