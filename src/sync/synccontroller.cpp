/*
 * synccontroller.cpp — Dispatches intents to the engine and applies results
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "synccontroller.h"
#include "htmlsanitizer.h"
#include "stringdiffer.h"
#include "textviewhost.h"

#include <QDebug>
#include <QScopeGuard>

#include <type_traits>
#include <variant>

using namespace Projection;

template<class>
inline constexpr bool kAlwaysFalse = false;

SyncController::SyncController(ComposerEngine *engine, TextViewHost *host,
                               const ComposerSettings &settings, QObject *parent)
    : QObject(parent)
    , m_engine(engine)
    , m_host(host)
    , m_settings(settings)
    , m_renderer(RenderStyle(settings), settings.listDecoration)
{
    m_renderer.setMentionDisplayHandler(&m_session.mentionCache());
}

QString SyncController::stateName(State state)
{
    switch (state) {
    case State::Idle:        return QStringLiteral("idle");
    case State::Dispatching: return QStringLiteral("dispatching");
    case State::Applying:    return QStringLiteral("applying");
    case State::Faulted:     return QStringLiteral("faulted");
    }
    return QString();
}

void SyncController::setMentionDisplayHandler(MentionDisplayHandler *handler)
{
    m_session.mentionCache().setDelegate(handler);
}

ActionState SyncController::actionState(ComposerAction action) const
{
    return m_session.actionState(action);
}

// --- Session lifecycle ---

bool SyncController::openSession()
{
    if (m_state != State::Idle) {
        qWarning() << "SyncController: cannot open a session while" << stateName(m_state);
        return false;
    }
    m_pendingSnapshots.clear();
    m_resyncPending = false;
    m_session.open();
    return runEngineCall(QStringLiteral("clear"),
                         [this]() -> std::optional<ComposerUpdate> { return m_engine->clear(); });
}

void SyncController::closeSession()
{
    m_pendingSnapshots.clear();
    m_resyncPending = false;
    m_session.close();
}

// --- Dispatch ---

bool SyncController::dispatch(const ComposerIntent &intent)
{
    return runEngineCall(intentName(intent), [this, &intent]() { return callEngine(intent); });
}

bool SyncController::runEngineCall(const QString &name,
                                   const std::function<std::optional<ComposerUpdate>()> &call)
{
    if (m_state != State::Idle) {
        qWarning() << "SyncController: refusing" << name << "while" << stateName(m_state);
        return false;
    }
    if (!m_session.isOpen()) {
        qWarning() << "SyncController: refusing" << name << "without an open session";
        return false;
    }

    m_state = State::Dispatching;
    // Any exception leaving this call must not leave the controller busy
    auto resetState = qScopeGuard([this]() { m_state = State::Idle; });
    try {
        const std::optional<ComposerUpdate> update = call();
        if (update) {
            m_state = State::Applying;
            applyUpdate(*update);
        }
    } catch (const ComposerEngineError &e) {
        m_state = State::Faulted;
        qWarning() << "SyncController:" << name << "failed:" << e.what();
        Q_EMIT engineFaulted(name, QString::fromUtf8(e.what()));
        m_state = State::Idle;
        if (m_settings.rethrowEngineFaults)
            throw;
        return false;
    }
    resetState.dismiss();
    m_state = State::Idle;

    drainSnapshots();
    return true;
}

std::optional<ComposerUpdate> SyncController::callEngine(const ComposerIntent &intent)
{
    const std::optional<SuggestionPattern> pattern = m_session.suggestionPattern();

    return std::visit([this, &pattern](const auto &i) -> std::optional<ComposerUpdate> {
        using T = std::decay_t<decltype(i)>;
        if constexpr (std::is_same_v<T, Intent::ReplaceText>) {
            return m_engine->replaceText(i.text);
        } else if constexpr (std::is_same_v<T, Intent::ReplaceTextIn>) {
            const TextRange range = TextRange{i.start, i.end}.normalized();
            return m_engine->replaceTextIn(i.text, range.start, range.end);
        } else if constexpr (std::is_same_v<T, Intent::InsertParagraph>) {
            return m_engine->enter();
        } else if constexpr (std::is_same_v<T, Intent::Backspace>) {
            return m_engine->backspace();
        } else if constexpr (std::is_same_v<T, Intent::DeleteIn>) {
            const TextRange range = TextRange{i.start, i.end}.normalized();
            return m_engine->deleteIn(range.start, range.end);
        } else if constexpr (std::is_same_v<T, Intent::ToggleInlineFormat>) {
            return m_engine->format(i.format);
        } else if constexpr (std::is_same_v<T, Intent::ToggleList>) {
            return m_engine->toggleList(i.ordered);
        } else if constexpr (std::is_same_v<T, Intent::ToggleCodeBlock>) {
            return m_engine->codeBlock();
        } else if constexpr (std::is_same_v<T, Intent::ToggleQuote>) {
            return m_engine->quote();
        } else if constexpr (std::is_same_v<T, Intent::Undo>) {
            return m_engine->undo();
        } else if constexpr (std::is_same_v<T, Intent::Redo>) {
            return m_engine->redo();
        } else if constexpr (std::is_same_v<T, Intent::Indent>) {
            return m_engine->indent();
        } else if constexpr (std::is_same_v<T, Intent::Unindent>) {
            return m_engine->unindent();
        } else if constexpr (std::is_same_v<T, Intent::SetLink>) {
            return m_engine->setLink(i.url);
        } else if constexpr (std::is_same_v<T, Intent::RemoveLinks>) {
            return m_engine->removeLinks();
        } else if constexpr (std::is_same_v<T, Intent::SetLinkWithText>) {
            return m_engine->setLinkWithText(i.url, i.text);
        } else if constexpr (std::is_same_v<T, Intent::UpdateSelection>) {
            const TextRange range = TextRange{i.start, i.end}.normalized();
            return m_engine->select(range.start, range.end);
        } else if constexpr (std::is_same_v<T, Intent::ReplaceAllHtml>) {
            return m_engine->setContentFromHtml(HtmlSanitizer::sanitize(i.html));
        } else if constexpr (std::is_same_v<T, Intent::ReplaceTextSuggestion>) {
            if (!pattern) {
                qDebug() << "SyncController: no pending suggestion, ignoring replace-text-suggestion";
                return std::nullopt;
            }
            return m_engine->replaceTextSuggestion(i.text, *pattern);
        } else if constexpr (std::is_same_v<T, Intent::InsertMentionAtSuggestion>) {
            if (!pattern) {
                qDebug() << "SyncController: no pending suggestion, ignoring mention" << i.url;
                return std::nullopt;
            }
            return m_engine->insertMentionAtSuggestion(i.url, i.text, *pattern);
        } else if constexpr (std::is_same_v<T, Intent::InsertAtRoomMentionAtSuggestion>) {
            if (!pattern) {
                qDebug() << "SyncController: no pending suggestion, ignoring @room mention";
                return std::nullopt;
            }
            return m_engine->insertAtRoomMentionAtSuggestion(*pattern);
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled composer intent");
        }
    }, intent);
}

// --- Applying engine results ---

void SyncController::applyUpdate(const ComposerUpdate &update)
{
    applyTextUpdate(update.textUpdate);
    mergeMenuState(update.menuState);
    applyMenuAction(update.menuAction);
}

void SyncController::applyTextUpdate(const TextUpdate &update)
{
    std::visit([this](const auto &u) {
        using T = std::decay_t<decltype(u)>;
        if constexpr (std::is_same_v<T, KeepUpdate>) {
            // nothing to do
        } else if constexpr (std::is_same_v<T, ReplaceAllUpdate>) {
            m_session.setPlainText(u.replacementText);
            refreshView(m_engine->blockProjections(), true);
            if (u.replacementText.size() != m_session.mapper().modelLength()) {
                qDebug() << "SyncController: engine text has" << u.replacementText.size()
                         << "code units, rendered model covers" << m_session.mapper().modelLength();
            }
            applySelection(TextRange{u.startUtf16, u.endUtf16});
        } else if constexpr (std::is_same_v<T, SelectUpdate>) {
            applySelection(TextRange{u.startUtf16, u.endUtf16});
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled text update");
        }
    }, update);
}

void SyncController::mergeMenuState(const MenuStateUpdate &update)
{
    if (update.isEmpty())
        return;
    m_session.mergeMenuState(update);
    Q_EMIT actionStatesChanged();
}

void SyncController::applyMenuAction(const MenuAction &action)
{
    std::visit([this](const auto &a) {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, KeepMenuAction>) {
            // keep the current suggestion
        } else if constexpr (std::is_same_v<T, NoMenuAction>) {
            if (m_session.suggestionPattern()) {
                m_session.clearSuggestionPattern();
                Q_EMIT suggestionPatternChanged();
            }
        } else if constexpr (std::is_same_v<T, SuggestionMenuAction>) {
            const auto &current = m_session.suggestionPattern();
            if (!current || !(*current == a.pattern)) {
                m_session.setSuggestionPattern(a.pattern);
                Q_EMIT suggestionPatternChanged();
            }
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled menu action");
        }
    }, action);
}

void SyncController::refreshView(const QList<BlockProjection> &blocks, bool allowPatching)
{
    const RenderResult rendered = m_renderer.render(blocks);
    if (!allowPatching || !patchView(rendered))
        m_host->replaceAll(*rendered.document);

    m_session.setMapper(rendered.mapper());
    m_host->setListMarkers(rendered.markers);
    Q_EMIT textApplied();
}

bool SyncController::patchView(const RenderResult &rendered)
{
    if (m_settings.viewPatchMode != ComposerSettings::ViewPatchMode::Diff
        || !m_host->supportsPatching()) {
        return false;
    }

    const auto patches = StringDiffer::patchSequence(m_host->text(), rendered.viewText(),
                                                     m_settings.maxDiffIterations);
    if (!patches)
        return false;

    for (const StringReplacement &patch : *patches) {
        if (!m_host->replaceRange(patch.location, patch.length, patch.text)) {
            qWarning() << "SyncController: view rejected patch at" << patch.location;
            return false;
        }
    }

    if (!m_host->syncFormats(*rendered.document)) {
        qDebug() << "SyncController: view structure differs after patching, replacing";
        return false;
    }
    return true;
}

void SyncController::applySelection(const TextRange &modelRange)
{
    const IndexMapper &mapper = m_session.mapper();
    std::optional<TextRange> view;
    if (mapper.isCompatible(m_host->length()))
        view = mapper.toView(modelRange);
    if (!view) {
        markDiverged("model selection");
        return;
    }

    m_session.setSelection(modelRange);
    m_host->setSelection(view->start, view->end);
    Q_EMIT selectionApplied(view->start, view->end);
}

void SyncController::markDiverged(const char *what)
{
    qWarning() << "SyncController: cannot map" << what << "- view out of sync";
    m_resyncPending = true;
    Q_EMIT resyncRequested();
}

// --- View events ---

void SyncController::viewSelectionChanged(int viewStart, int viewEnd)
{
    // Selection changes caused by our own updates are not user input
    if (m_state != State::Idle)
        return;

    const IndexMapper &mapper = m_session.mapper();
    std::optional<TextRange> model;
    if (mapper.isCompatible(m_host->length()))
        model = mapper.toModel(TextRange{viewStart, viewEnd});
    if (!model) {
        markDiverged("view selection");
        drainSnapshots();
        return;
    }
    if (*model == m_session.selection())
        return;

    m_session.setSelection(*model);
    dispatch(Intent::UpdateSelection{model->start, model->end});
}

// --- Snapshots and resync ---

void SyncController::processSnapshot(const Snapshot &snapshot)
{
    if (!m_session.isOpen()) {
        qWarning() << "SyncController: dropping snapshot without an open session";
        return;
    }
    m_pendingSnapshots.enqueue(snapshot);
    drainSnapshots();
}

void SyncController::drainSnapshots()
{
    while (m_state == State::Idle && !m_pendingSnapshots.isEmpty())
        applySnapshot(m_pendingSnapshots.dequeue());

    if (m_state == State::Idle && m_resyncPending)
        requestFullResync();
}

void SyncController::applySnapshot(const Snapshot &snapshot)
{
    // A handler may have closed the session while earlier snapshots applied
    if (!m_session.isOpen()) {
        qWarning() << "SyncController: dropping snapshot for a closed session";
        return;
    }

    m_state = State::Applying;
    const auto resetState = qScopeGuard([this]() { m_state = State::Idle; });
    refreshView(snapshot.blocks, true);
    if (!m_session.isOpen())
        return;
    mergeMenuState(snapshot.menuState);
    applySelection(snapshot.selection);
}

void SyncController::requestFullResync()
{
    if (m_state != State::Idle) {
        m_resyncPending = true;
        return;
    }
    m_resyncPending = false;
    if (!m_session.isOpen())
        return;

    m_state = State::Applying;
    const auto resetState = qScopeGuard([this]() { m_state = State::Idle; });
    try {
        refreshView(m_engine->blockProjections(), false);
    } catch (const ComposerEngineError &e) {
        qWarning() << "SyncController: resync failed:" << e.what();
        Q_EMIT engineFaulted(QStringLiteral("resync"), QString::fromUtf8(e.what()));
        if (m_settings.rethrowEngineFaults)
            throw;
        return;
    }

    // A fresh render always matches the view, so a clamped selection maps
    const int modelLength = m_session.mapper().modelLength();
    const Selection previous = m_session.selection();
    applySelection(TextRange{qBound(0, previous.start, modelLength),
                             qBound(0, previous.end, modelLength)});
    m_resyncPending = false;
}
