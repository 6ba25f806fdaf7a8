/*
 * composersettings_test.cpp — KConfig-backed composer settings
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "composersettings.h"
#include "renderstyle.h"

#include <KConfig>
#include <KConfigGroup>

namespace {

// In-memory config, nothing touches the disk
KConfigGroup composerGroup(KConfig &config)
{
    return config.group(QStringLiteral("Composer"));
}

} // anonymous namespace

TEST(ComposerSettingsTest, EmptyGroupGivesDefaults)
{
    KConfig config(QString(), KConfig::SimpleConfig);
    const ComposerSettings loaded = ComposerSettings::load(composerGroup(config));
    const ComposerSettings defaults;

    EXPECT_EQ(loaded.listDecoration, ComposerSettings::ListDecoration::Gutter);
    EXPECT_EQ(loaded.viewPatchMode, ComposerSettings::ViewPatchMode::Diff);
    EXPECT_EQ(loaded.maxDiffIterations, 16);
    EXPECT_EQ(loaded.rethrowEngineFaults, defaults.rethrowEngineFaults);
    EXPECT_EQ(loaded.linkColor, defaults.linkColor);
    EXPECT_EQ(loaded.bodyFont.family(), defaults.bodyFont.family());
    EXPECT_DOUBLE_EQ(loaded.quoteIndent, 20.0);
    EXPECT_DOUBLE_EQ(loaded.listGutterWidth, 24.0);
}

TEST(ComposerSettingsTest, ReadsEntries)
{
    KConfig config(QString(), KConfig::SimpleConfig);
    KConfigGroup group = composerGroup(config);
    group.writeEntry("ListDecoration", QStringLiteral("inline"));
    group.writeEntry("ViewPatchMode", QStringLiteral("full"));
    group.writeEntry("MaxDiffIterations", 4);
    group.writeEntry("RethrowEngineFaults", true);
    group.writeEntry("LinkColor", QStringLiteral("#ff0000"));
    group.writeEntry("QuoteIndent", 32.0);

    const ComposerSettings s = ComposerSettings::load(group);
    EXPECT_EQ(s.listDecoration, ComposerSettings::ListDecoration::Inline);
    EXPECT_EQ(s.viewPatchMode, ComposerSettings::ViewPatchMode::FullReplace);
    EXPECT_EQ(s.maxDiffIterations, 4);
    EXPECT_TRUE(s.rethrowEngineFaults);
    EXPECT_EQ(s.linkColor, QColor(255, 0, 0));
    EXPECT_DOUBLE_EQ(s.quoteIndent, 32.0);
}

TEST(ComposerSettingsTest, InvalidEntriesFallBack)
{
    KConfig config(QString(), KConfig::SimpleConfig);
    KConfigGroup group = composerGroup(config);
    group.writeEntry("ListDecoration", QStringLiteral("sideways"));
    group.writeEntry("ViewPatchMode", QStringLiteral("sometimes"));
    group.writeEntry("MaxDiffIterations", 0);
    group.writeEntry("LinkColor", QStringLiteral("not a color"));

    const ComposerSettings s = ComposerSettings::load(group);
    const ComposerSettings defaults;
    EXPECT_EQ(s.listDecoration, ComposerSettings::ListDecoration::Gutter);
    EXPECT_EQ(s.viewPatchMode, ComposerSettings::ViewPatchMode::Diff);
    EXPECT_EQ(s.maxDiffIterations, 1);
    EXPECT_EQ(s.linkColor, defaults.linkColor);
}

TEST(ComposerSettingsTest, SaveThenLoad)
{
    ComposerSettings original;
    original.listDecoration = ComposerSettings::ListDecoration::Inline;
    original.viewPatchMode = ComposerSettings::ViewPatchMode::FullReplace;
    original.maxDiffIterations = 7;
    original.rethrowEngineFaults = false;
    original.markerColor = QColor(0x12, 0x34, 0x56);
    original.listGutterWidth = 30.0;

    KConfig config(QString(), KConfig::SimpleConfig);
    KConfigGroup group = composerGroup(config);
    original.save(group);

    const ComposerSettings loaded = ComposerSettings::load(group);
    EXPECT_EQ(loaded.listDecoration, original.listDecoration);
    EXPECT_EQ(loaded.viewPatchMode, original.viewPatchMode);
    EXPECT_EQ(loaded.maxDiffIterations, 7);
    EXPECT_FALSE(loaded.rethrowEngineFaults);
    EXPECT_EQ(loaded.markerColor, original.markerColor);
    EXPECT_DOUBLE_EQ(loaded.listGutterWidth, 30.0);
    EXPECT_EQ(loaded.codeFont.family(), original.codeFont.family());
}

TEST(ComposerSettingsTest, NamesModes)
{
    EXPECT_EQ(ComposerSettings::listDecorationName(ComposerSettings::ListDecoration::Gutter),
              QStringLiteral("gutter"));
    EXPECT_EQ(ComposerSettings::listDecorationName(ComposerSettings::ListDecoration::Inline),
              QStringLiteral("inline"));
    EXPECT_EQ(ComposerSettings::viewPatchModeName(ComposerSettings::ViewPatchMode::Diff),
              QStringLiteral("diff"));
    EXPECT_EQ(ComposerSettings::viewPatchModeName(ComposerSettings::ViewPatchMode::FullReplace),
              QStringLiteral("full"));
}

TEST(RenderStyleTest, CopiesSettings)
{
    ComposerSettings settings;
    settings.pillBackground = QColor(1, 2, 3);
    settings.listGutterWidth = 10.0;
    settings.quoteIndent = 5.0;

    const RenderStyle style(settings);
    EXPECT_EQ(style.pillBackground, QColor(1, 2, 3));
    EXPECT_DOUBLE_EQ(style.listHeadIndent(2, false), 20.0);
    EXPECT_DOUBLE_EQ(style.listHeadIndent(2, true), 25.0);
    EXPECT_EQ(style.listItemBlockFormat(2, false).property(ListDepthProperty).toInt(), 2);
}
