/*
 * listdecoration.cpp — List marker strategies and ordinal counting
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "listdecoration.h"

static constexpr QChar kBullet(0x2022);

std::unique_ptr<ListDecorationStrategy>
ListDecorationStrategy::create(ComposerSettings::ListDecoration mode)
{
    switch (mode) {
    case ComposerSettings::ListDecoration::Inline:
        return std::make_unique<InlineMarkerStrategy>();
    case ComposerSettings::ListDecoration::Gutter:
        break;
    }
    return std::make_unique<GutterMarkerStrategy>();
}

QString InlineMarkerStrategy::inlineText(const Projection::ListMarkerInfo &marker) const
{
    if (marker.text.isEmpty())
        return QString();
    return marker.text + QLatin1Char(' ');
}

QString ListOrdinalCounter::next(const Projection::BlockKind &kind)
{
    if (!kind.isList()) {
        reset();
        return QString();
    }

    const int depth = qMax(1, kind.depth);
    while (m_counters.size() > depth)
        m_counters.removeLast();
    while (m_counters.size() < depth)
        m_counters.append(0);

    if (kind.listType == Projection::ListType::Unordered) {
        // An unordered item interrupts numbering at its own depth
        m_counters[depth - 1] = 0;
        return QString(kBullet);
    }

    ++m_counters[depth - 1];
    return QString::number(m_counters[depth - 1]) + QLatin1Char('.');
}
