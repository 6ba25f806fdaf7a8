/*
 * decorationregistry.cpp — Ordered view-only spans
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "decorationregistry.h"

#include <QDebug>

#include <algorithm>

bool DecorationRegistry::add(const Decoration &decoration)
{
    if (decoration.length <= 0 || decoration.viewStart < 0) {
        qWarning() << "DecorationRegistry: rejecting empty span at" << decoration.viewStart;
        return false;
    }
    if (!m_decorations.isEmpty() && decoration.viewStart < m_decorations.last().viewEnd()) {
        qWarning() << "DecorationRegistry: span at" << decoration.viewStart
                   << "overlaps or precedes span ending at" << m_decorations.last().viewEnd();
        return false;
    }
    m_decorations.append(decoration);
    m_totalLength += decoration.length;
    return true;
}

bool DecorationRegistry::add(int viewStart, int length, Decoration::Placement placement,
                             Decoration::Kind kind)
{
    return add(Decoration{viewStart, length, placement, kind});
}

void DecorationRegistry::clear()
{
    m_decorations.clear();
    m_totalLength = 0;
}

const Decoration *DecorationRegistry::decorationAt(int viewOffset) const
{
    auto it = std::upper_bound(m_decorations.cbegin(), m_decorations.cend(), viewOffset,
                               [](int offset, const Decoration &d) {
                                   return offset < d.viewStart;
                               });
    if (it == m_decorations.cbegin())
        return nullptr;
    --it;
    if (viewOffset < it->viewEnd())
        return &*it;
    return nullptr;
}

QString DecorationRegistry::kindName(Decoration::Kind kind)
{
    switch (kind) {
    case Decoration::Kind::Separator:      return QStringLiteral("separator");
    case Decoration::Kind::ListMarker:     return QStringLiteral("list-marker");
    case Decoration::Kind::RunSurplus:     return QStringLiteral("run-surplus");
    }
    return QString();
}
