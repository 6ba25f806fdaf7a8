/*
 * fakecomposerengine.cpp — Scripted ComposerEngine for controller tests
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fakecomposerengine.h"

#include <stdexcept>

using namespace Projection;

static constexpr QChar kMentionUnit(0xFFFC);

void FakeComposerEngine::begin(const char *name)
{
    ++callCount;
    lastCall = QString::fromLatin1(name);
    if (onCall)
        onCall();
    if (failNext) {
        failNext = false;
        throw ComposerEngineError(std::string("engine failed in ") + name);
    }
    if (crashNext) {
        crashNext = false;
        throw std::runtime_error(std::string("engine crashed in ") + name);
    }
}

void FakeComposerEngine::replaceRange(int start, int end, const QString &text, const Unit &unit)
{
    const TextRange range = TextRange{start, end}.normalized();
    const int from = qBound(0, range.start, int(m_text.size()));
    const int to = qBound(from, range.end, int(m_text.size()));

    m_text.replace(from, to - from, text);
    m_units.remove(from, to - from);
    for (int i = 0; i < text.size(); ++i)
        m_units.insert(from + i, unit);

    const int cursor = from + text.size();
    selection = {cursor, cursor};
}

MenuStateUpdate FakeComposerEngine::boldState() const
{
    MenuStateUpdate menu;
    menu.insert(ComposerAction::Bold, m_boldActive ? ActionState::Reversed : ActionState::Enabled);
    return menu;
}

ComposerUpdate FakeComposerEngine::finish(ComposerUpdate update)
{
    if (nextMenuAction) {
        update.menuAction = *nextMenuAction;
        nextMenuAction.reset();
    }
    return update;
}

ComposerUpdate FakeComposerEngine::textChanged(const MenuStateUpdate &menu)
{
    ComposerUpdate update;
    update.textUpdate = ReplaceAllUpdate{m_text, selection.start, selection.end};
    update.menuState = menu;
    return finish(update);
}

// --- Editing ---

ComposerUpdate FakeComposerEngine::replaceText(const QString &text)
{
    begin("replaceText");
    Unit unit;
    unit.bold = m_boldActive;
    replaceRange(selection.start, selection.end, text, unit);
    return textChanged();
}

ComposerUpdate FakeComposerEngine::replaceTextIn(const QString &text, int start, int end)
{
    begin("replaceTextIn");
    Unit unit;
    unit.bold = m_boldActive;
    replaceRange(start, end, text, unit);
    return textChanged();
}

ComposerUpdate FakeComposerEngine::enter()
{
    begin("enter");
    replaceRange(selection.start, selection.end, QStringLiteral("\n"), Unit());
    return textChanged();
}

ComposerUpdate FakeComposerEngine::backspace()
{
    begin("backspace");
    if (selection.isCollapsed()) {
        if (selection.start == 0)
            return finish(ComposerUpdate());
        replaceRange(selection.start - 1, selection.start, QString(), Unit());
    } else {
        replaceRange(selection.start, selection.end, QString(), Unit());
    }
    return textChanged();
}

ComposerUpdate FakeComposerEngine::deleteIn(int start, int end)
{
    begin("deleteIn");
    replaceRange(start, end, QString(), Unit());
    return textChanged();
}

ComposerUpdate FakeComposerEngine::clear()
{
    begin("clear");
    m_text.clear();
    m_units.clear();
    m_boldActive = false;
    m_list.reset();
    selection = {};

    MenuStateUpdate menu;
    menu.insert(ComposerAction::Bold, ActionState::Enabled);
    menu.insert(ComposerAction::Italic, ActionState::Enabled);
    menu.insert(ComposerAction::Undo, ActionState::Disabled);
    return textChanged(menu);
}

// --- Formatting and structure ---

ComposerUpdate FakeComposerEngine::format(InlineFormat format)
{
    begin("format");
    if (format != InlineFormat::Bold)
        return finish(ComposerUpdate());

    m_boldActive = !m_boldActive;
    const TextRange range = selection.normalized();
    for (int i = range.start; i < range.end && i < m_units.size(); ++i)
        m_units[i].bold = m_boldActive;
    return textChanged(boldState());
}

ComposerUpdate FakeComposerEngine::toggleList(bool ordered)
{
    begin("toggleList");
    const ListType type = ordered ? ListType::Ordered : ListType::Unordered;
    if (m_list == type)
        m_list.reset();
    else
        m_list = type;

    MenuStateUpdate menu;
    const ActionState state = m_list ? ActionState::Reversed : ActionState::Enabled;
    menu.insert(ordered ? ComposerAction::OrderedList : ComposerAction::UnorderedList, state);
    return textChanged(menu);
}

ComposerUpdate FakeComposerEngine::codeBlock()
{
    begin("codeBlock");
    return finish(ComposerUpdate());
}

ComposerUpdate FakeComposerEngine::quote()
{
    begin("quote");
    return finish(ComposerUpdate());
}

ComposerUpdate FakeComposerEngine::indent()
{
    begin("indent");
    return finish(ComposerUpdate());
}

ComposerUpdate FakeComposerEngine::unindent()
{
    begin("unindent");
    return finish(ComposerUpdate());
}

// --- History ---

ComposerUpdate FakeComposerEngine::undo()
{
    begin("undo");
    ++undoCount;
    return finish(ComposerUpdate());
}

ComposerUpdate FakeComposerEngine::redo()
{
    begin("redo");
    return finish(ComposerUpdate());
}

// --- Links ---

ComposerUpdate FakeComposerEngine::setLink(const QString &)
{
    begin("setLink");
    return finish(ComposerUpdate());
}

ComposerUpdate FakeComposerEngine::removeLinks()
{
    begin("removeLinks");
    return finish(ComposerUpdate());
}

ComposerUpdate FakeComposerEngine::setLinkWithText(const QString &, const QString &text)
{
    begin("setLinkWithText");
    replaceRange(selection.start, selection.end, text, Unit());
    return textChanged();
}

ComposerUpdate FakeComposerEngine::select(int start, int end)
{
    begin("select");
    selection = {start, end};
    ComposerUpdate update;
    update.textUpdate = SelectUpdate{start, end};
    return finish(update);
}

ComposerUpdate FakeComposerEngine::setContentFromHtml(const QString &html)
{
    begin("setContentFromHtml");
    lastHtml = html;
    m_text.clear();
    m_units.clear();
    replaceRange(0, 0, QStringLiteral("imported"), Unit());
    return textChanged();
}

// --- Suggestions ---

ComposerUpdate FakeComposerEngine::replaceTextSuggestion(const QString &text,
                                                         const SuggestionPattern &pattern)
{
    begin("replaceTextSuggestion");
    lastPattern = pattern;
    replaceRange(pattern.startUtf16, pattern.endUtf16, text, Unit());
    ComposerUpdate update = textChanged();
    update.menuAction = NoMenuAction{};
    return update;
}

ComposerUpdate FakeComposerEngine::insertMentionAtSuggestion(const QString &url,
                                                             const QString &text,
                                                             const SuggestionPattern &pattern)
{
    begin("insertMentionAtSuggestion");
    lastPattern = pattern;
    Unit unit;
    unit.mentionUrl = url;
    unit.mentionText = text;
    replaceRange(pattern.startUtf16, pattern.endUtf16, QString(kMentionUnit), unit);
    ComposerUpdate update = textChanged();
    update.menuAction = NoMenuAction{};
    return update;
}

ComposerUpdate FakeComposerEngine::insertAtRoomMentionAtSuggestion(const SuggestionPattern &pattern)
{
    begin("insertAtRoomMentionAtSuggestion");
    lastPattern = pattern;
    Unit unit;
    unit.mentionUrl = QStringLiteral("@room");
    unit.mentionText = QStringLiteral("@room");
    replaceRange(pattern.startUtf16, pattern.endUtf16, QString(kMentionUnit), unit);
    ComposerUpdate update = textChanged();
    update.menuAction = NoMenuAction{};
    return update;
}

// --- Projections ---

BlockProjection FakeComposerEngine::makeBlock(int index, int start, int end) const
{
    BlockProjection block;
    block.blockId = QStringLiteral("b%1").arg(index);
    if (m_list)
        block.kind = BlockKind::listItem(*m_list, 1);
    block.startUtf16 = start;
    block.endUtf16 = end;

    int i = start;
    while (i < end) {
        InlineRun run;
        run.nodeId = QStringLiteral("n%1").arg(i);
        run.startUtf16 = i;
        const Unit &unit = m_units.at(i);
        if (!unit.mentionUrl.isEmpty()) {
            run.endUtf16 = i + 1;
            run.kind = MentionRun{unit.mentionUrl, unit.mentionText};
            ++i;
        } else {
            int j = i + 1;
            while (j < end && m_units.at(j).mentionUrl.isEmpty()
                   && m_units.at(j).bold == unit.bold) {
                ++j;
            }
            TextRun text;
            text.text = m_text.mid(i, j - i);
            text.attributes.bold = unit.bold;
            run.endUtf16 = j;
            run.kind = text;
            i = j;
        }
        block.inlineRuns.append(run);
    }
    return block;
}

QList<BlockProjection> FakeComposerEngine::blockProjections() const
{
    if (crashProjections) {
        crashProjections = false;
        throw std::runtime_error("projections unavailable");
    }
    QList<BlockProjection> blocks;
    int start = 0;
    for (int i = 0; i <= m_text.size(); ++i) {
        if (i == m_text.size() || m_text.at(i) == QLatin1Char('\n')) {
            blocks.append(makeBlock(blocks.size(), start, i));
            start = i + 1;
        }
    }
    return blocks;
}
