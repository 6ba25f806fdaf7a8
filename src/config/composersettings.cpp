/*
 * composersettings.cpp — Composer configuration stored in KConfig
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "composersettings.h"

#include <KConfigGroup>
#include <KSharedConfig>

#include <QDebug>

namespace {

QFont readFont(const KConfigGroup &group, const char *key, const QFont &fallback)
{
    const QString value = group.readEntry(key, QString());
    if (value.isEmpty())
        return fallback;
    QFont font = fallback;
    if (!font.fromString(value)) {
        qWarning() << "ComposerSettings: invalid font for" << key << value;
        return fallback;
    }
    return font;
}

QColor readColor(const KConfigGroup &group, const char *key, const QColor &fallback)
{
    const QString value = group.readEntry(key, QString());
    if (value.isEmpty())
        return fallback;
    const QColor color(value);
    if (!color.isValid()) {
        qWarning() << "ComposerSettings: invalid color for" << key << value;
        return fallback;
    }
    return color;
}

} // anonymous namespace

QFont ComposerSettings::defaultBodyFont()
{
    return QFont(QStringLiteral("Noto Sans"), 11);
}

QFont ComposerSettings::defaultCodeFont()
{
    QFont mono(QStringLiteral("JetBrains Mono"), 10);
    mono.setStyleHint(QFont::Monospace);
    mono.setFixedPitch(true);
    return mono;
}

QString ComposerSettings::listDecorationName(ListDecoration mode)
{
    return mode == ListDecoration::Inline ? QStringLiteral("inline")
                                          : QStringLiteral("gutter");
}

QString ComposerSettings::viewPatchModeName(ViewPatchMode mode)
{
    return mode == ViewPatchMode::FullReplace ? QStringLiteral("full")
                                              : QStringLiteral("diff");
}

ComposerSettings ComposerSettings::load(const KConfigGroup &group)
{
    ComposerSettings s;

    const QString decoration = group.readEntry("ListDecoration", QStringLiteral("gutter"));
    if (decoration == QLatin1String("inline"))
        s.listDecoration = ListDecoration::Inline;
    else if (decoration != QLatin1String("gutter"))
        qWarning() << "ComposerSettings: unknown ListDecoration" << decoration;

    const QString patchMode = group.readEntry("ViewPatchMode", QStringLiteral("diff"));
    if (patchMode == QLatin1String("full"))
        s.viewPatchMode = ViewPatchMode::FullReplace;
    else if (patchMode != QLatin1String("diff"))
        qWarning() << "ComposerSettings: unknown ViewPatchMode" << patchMode;

    // At least one patch is needed to make any progress
    s.maxDiffIterations = qMax(1, group.readEntry("MaxDiffIterations", s.maxDiffIterations));
    s.rethrowEngineFaults = group.readEntry("RethrowEngineFaults", s.rethrowEngineFaults);

    s.bodyFont = readFont(group, "BodyFont", s.bodyFont);
    s.codeFont = readFont(group, "CodeFont", s.codeFont);
    s.codeFont.setStyleHint(QFont::Monospace);
    s.linkColor = readColor(group, "LinkColor", s.linkColor);
    s.codeBackground = readColor(group, "CodeBackground", s.codeBackground);
    s.pillBackground = readColor(group, "PillBackground", s.pillBackground);
    s.markerColor = readColor(group, "MarkerColor", s.markerColor);
    s.quoteIndent = group.readEntry("QuoteIndent", s.quoteIndent);
    s.listGutterWidth = group.readEntry("ListGutterWidth", s.listGutterWidth);

    return s;
}

void ComposerSettings::save(KConfigGroup &group) const
{
    group.writeEntry("ListDecoration", listDecorationName(listDecoration));
    group.writeEntry("ViewPatchMode", viewPatchModeName(viewPatchMode));
    group.writeEntry("MaxDiffIterations", maxDiffIterations);
    group.writeEntry("RethrowEngineFaults", rethrowEngineFaults);
    group.writeEntry("BodyFont", bodyFont.toString());
    group.writeEntry("CodeFont", codeFont.toString());
    group.writeEntry("LinkColor", linkColor.name());
    group.writeEntry("CodeBackground", codeBackground.name());
    group.writeEntry("PillBackground", pillBackground.name());
    group.writeEntry("MarkerColor", markerColor.name());
    group.writeEntry("QuoteIndent", quoteIndent);
    group.writeEntry("ListGutterWidth", listGutterWidth);
}

ComposerSettings ComposerSettings::fromConfig()
{
    KConfigGroup group(KSharedConfig::openConfig(), QStringLiteral("Composer"));
    return load(group);
}
