/*
 * indexmapper.cpp — Model <-> view offset translation
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "indexmapper.h"

#include <QDebug>

using Projection::TextRange;

IndexMapper::IndexMapper(const DecorationRegistry &registry, int viewLength)
    : m_decorations(registry.decorations())
    , m_viewLength(viewLength)
    , m_decorationLength(registry.totalLength())
    , m_valid(true)
{
    if (!m_decorations.isEmpty() && m_decorations.last().viewEnd() > viewLength) {
        qWarning() << "IndexMapper: decoration ends at" << m_decorations.last().viewEnd()
                   << "beyond view length" << viewLength;
        m_valid = false;
    }
}

bool IndexMapper::isCompatible(int liveViewLength) const
{
    return m_valid && liveViewLength == m_viewLength;
}

int IndexMapper::mapViewOffset(int viewOffset) const
{
    int removed = 0;
    for (const Decoration &d : m_decorations) {
        if (d.viewEnd() <= viewOffset) {
            removed += d.length;
            continue;
        }
        // Strictly inside: snap to the span edge, which has no model width
        if (d.viewStart < viewOffset)
            return d.viewStart - removed;
        break;
    }
    return viewOffset - removed;
}

int IndexMapper::mapModelOffset(int modelOffset, bool skipBoundary) const
{
    int view = modelOffset;
    for (const Decoration &d : m_decorations) {
        if (d.viewStart < view
            || (d.viewStart == view
                && (skipBoundary || d.placement == Decoration::Placement::BoundaryAfter))) {
            view += d.length;
            continue;
        }
        break;
    }
    return view;
}

std::optional<int> IndexMapper::toModelOffset(int viewOffset) const
{
    if (!m_valid || viewOffset < 0 || viewOffset > m_viewLength)
        return std::nullopt;
    return mapViewOffset(viewOffset);
}

std::optional<int> IndexMapper::toViewOffset(int modelOffset) const
{
    if (!m_valid || modelOffset < 0 || modelOffset > modelLength())
        return std::nullopt;
    return mapModelOffset(modelOffset, false);
}

std::optional<TextRange> IndexMapper::toModel(const TextRange &viewRange) const
{
    const auto start = toModelOffset(viewRange.start);
    const auto end = toModelOffset(viewRange.end);
    if (!start || !end)
        return std::nullopt;
    return TextRange{*start, *end};
}

std::optional<TextRange> IndexMapper::toView(const TextRange &modelRange) const
{
    if (modelRange.start == modelRange.end) {
        const auto caret = toViewOffset(modelRange.start);
        if (!caret)
            return std::nullopt;
        return TextRange{*caret, *caret};
    }

    const int low = qMin(modelRange.start, modelRange.end);
    const int high = qMax(modelRange.start, modelRange.end);
    if (!m_valid || low < 0 || high > modelLength())
        return std::nullopt;

    // The selected text begins after any decoration sitting at its first offset
    const int viewLow = mapModelOffset(low, true);
    const int viewHigh = mapModelOffset(high, false);
    if (modelRange.start < modelRange.end)
        return TextRange{viewLow, viewHigh};
    return TextRange{viewHigh, viewLow};
}
