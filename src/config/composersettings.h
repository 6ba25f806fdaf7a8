/*
 * composersettings.h — Composer configuration stored in KConfig
 *
 * Read from the "Composer" group of the application config. Fonts and
 * colors are kept as strings (QFont::toString, #rrggbb names) so only
 * KConfigCore is needed.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_COMPOSERSETTINGS_H
#define RICHCOMPOSER_COMPOSERSETTINGS_H

#include <QColor>
#include <QFont>
#include <QString>

class KConfigGroup;

struct ComposerSettings {
    enum class ListDecoration {
        Gutter,     // markers drawn beside the text, never inserted
        Inline      // marker text inserted into the view as decoration
    };

    enum class ViewPatchMode {
        Diff,           // patch the live view with StringDiffer replacements
        FullReplace     // swap the whole document on every update
    };

    ListDecoration listDecoration = ListDecoration::Gutter;
    ViewPatchMode viewPatchMode = ViewPatchMode::Diff;
    int maxDiffIterations = 16;
#ifdef QT_DEBUG
    bool rethrowEngineFaults = true;
#else
    bool rethrowEngineFaults = false;
#endif

    QFont bodyFont = defaultBodyFont();
    QFont codeFont = defaultCodeFont();
    QColor linkColor = QColor(0x03, 0x66, 0xd6);
    QColor codeBackground = QColor(0xf6, 0xf8, 0xfa);
    QColor pillBackground = QColor(0xe3, 0xe8, 0xf0);
    QColor markerColor = QColor(0x55, 0x55, 0x55);
    qreal quoteIndent = 20.0;
    qreal listGutterWidth = 24.0;

    static QFont defaultBodyFont();
    static QFont defaultCodeFont();

    static ComposerSettings load(const KConfigGroup &group);
    void save(KConfigGroup &group) const;

    // Application config, group "Composer"
    static ComposerSettings fromConfig();

    static QString listDecorationName(ListDecoration mode);
    static QString viewPatchModeName(ViewPatchMode mode);
};

#endif // RICHCOMPOSER_COMPOSERSETTINGS_H
