/*
 * main.cpp — richcomposer-render: render a JSON projection file
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QCommandLineParser>
#include <QFile>
#include <QGuiApplication>
#include <QTextStream>

#include <KAboutData>
#include <KConfig>
#include <KConfigGroup>
#include <KLocalizedString>

#include "composersettings.h"
#include "decorationregistry.h"
#include "mentionurl.h"
#include "projectionjson.h"
#include "projectionrenderer.h"

namespace {

QString visibleText(QString text)
{
    text.replace(QChar::ParagraphSeparator, QLatin1Char('\n'));
    text.replace(QChar::LineSeparator, QStringLiteral("\\n"));
    text.replace(QChar(0xFFFC), QLatin1Char('?'));
    return text;
}

QStringList sorted(const QSet<QString> &set)
{
    QStringList list(set.cbegin(), set.cend());
    list.sort();
    return list;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("richcomposer");

    KAboutData aboutData(
        QStringLiteral("richcomposer-render"),
        i18n("RichComposer Render"),
        QStringLiteral("0.1.0"),
        i18n("Renders a composer projection file and reports its view mapping"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2026"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(
        QStringLiteral("file"),
        i18n("Projection JSON file, or - for standard input"));

    const QCommandLineOption listOption(
        {QStringLiteral("l"), QStringLiteral("list-decoration")},
        i18n("List marker placement: gutter or inline"),
        QStringLiteral("mode"));
    const QCommandLineOption htmlOption(
        QStringLiteral("html"),
        i18n("Print the rendered document as HTML instead of plain text"));
    const QCommandLineOption configOption(
        {QStringLiteral("c"), QStringLiteral("config")},
        i18n("Read composer settings from this config file"),
        QStringLiteral("file"));
    parser.addOption(listOption);
    parser.addOption(htmlOption);
    parser.addOption(configOption);

    parser.process(app);
    aboutData.processCommandLine(&parser);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        err << i18n("Expected exactly one projection file") << Qt::endl;
        return 1;
    }

    ComposerSettings settings;
    if (parser.isSet(configOption)) {
        KConfig config(parser.value(configOption), KConfig::SimpleConfig);
        settings = ComposerSettings::load(config.group(QStringLiteral("Composer")));
    }
    if (parser.isSet(listOption)) {
        const QString mode = parser.value(listOption);
        if (mode == QLatin1String("inline")) {
            settings.listDecoration = ComposerSettings::ListDecoration::Inline;
        } else if (mode == QLatin1String("gutter")) {
            settings.listDecoration = ComposerSettings::ListDecoration::Gutter;
        } else {
            err << i18n("Unknown list decoration: %1", mode) << Qt::endl;
            return 1;
        }
    }

    QFile file;
    bool opened = false;
    if (args.first() == QLatin1String("-"))
        opened = file.open(stdin, QIODevice::ReadOnly);
    else {
        file.setFileName(args.first());
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        err << i18n("Cannot open %1: %2", args.first(), file.errorString()) << Qt::endl;
        return 1;
    }

    QString error;
    const auto snapshot = ProjectionJson::readSnapshot(file.readAll(), &error);
    if (!snapshot) {
        err << i18n("Invalid projection: %1", error) << Qt::endl;
        return 1;
    }
    if (const auto invalid = Projection::validate(snapshot->blocks)) {
        err << i18n("Invalid projection at block %1, run %2: %3",
                    invalid->blockIndex, invalid->runIndex, invalid->message)
            << Qt::endl;
        return 1;
    }

    const ProjectionRenderer renderer(RenderStyle(settings), settings.listDecoration);
    const RenderResult result = renderer.render(snapshot->blocks);

    if (parser.isSet(htmlOption))
        out << result.document->toHtml() << Qt::endl;
    else
        out << visibleText(result.viewText()) << Qt::endl;

    const IndexMapper mapper = result.mapper();
    out << Qt::endl
        << "view length: " << mapper.viewLength()
        << ", model length: " << mapper.modelLength() << Qt::endl;

    // --- Blocks ---
    for (const BlockOffset &offset : result.blockOffsets) {
        out << "block " << offset.blockId
            << " view [" << offset.viewStart << ", " << offset.viewEnd << ")"
            << " model [" << offset.modelStart << ", " << offset.modelEnd << ")"
            << " delta " << offset.delta << Qt::endl;
    }

    // --- Markers ---
    for (const Projection::ListMarkerInfo &marker : result.markers) {
        out << "marker \"" << marker.text << "\" at " << marker.characterIndex
            << " indent " << marker.headIndent << Qt::endl;
    }

    // --- Decorations ---
    for (const Decoration &decoration : result.decorations.decorations()) {
        out << "decoration " << DecorationRegistry::kindName(decoration.kind)
            << " [" << decoration.viewStart << ", " << decoration.viewEnd() << ")"
            << (decoration.placement == Decoration::Placement::BoundaryAfter
                    ? " after" : " before")
            << Qt::endl;
    }

    // --- Mentions ---
    const MentionsState mentions = MentionsState::collect(snapshot->blocks);
    if (!mentions.userIds.isEmpty())
        out << "users: " << sorted(mentions.userIds).join(QStringLiteral(", ")) << Qt::endl;
    if (!mentions.roomAliases.isEmpty())
        out << "room aliases: " << sorted(mentions.roomAliases).join(QStringLiteral(", ")) << Qt::endl;
    if (!mentions.roomIds.isEmpty())
        out << "room ids: " << sorted(mentions.roomIds).join(QStringLiteral(", ")) << Qt::endl;
    if (mentions.hasAtRoomMention)
        out << "mentions @room" << Qt::endl;

    const Projection::Selection selection = snapshot->selection;
    if (const auto view = mapper.toView(selection)) {
        out << "selection model [" << selection.start << ", " << selection.end
            << ") view [" << view->start << ", " << view->end << ")" << Qt::endl;
    } else {
        err << i18n("Selection %1..%2 is outside the document", selection.start, selection.end)
            << Qt::endl;
        return 1;
    }

    return 0;
}
