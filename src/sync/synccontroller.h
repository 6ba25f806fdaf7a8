/*
 * synccontroller.h — Dispatches intents to the engine and applies results
 *
 * One engine call per intent. The returned text update is rendered with
 * ProjectionRenderer and written into the TextViewHost, either as a
 * sequence of StringDiffer patches or as a whole document. Menu state is
 * merged into the EditingSession and selections travel through the
 * session's IndexMapper.
 *
 * Single-threaded and non-reentrant: a dispatch issued while another one
 * is being applied is refused.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef RICHCOMPOSER_SYNCCONTROLLER_H
#define RICHCOMPOSER_SYNCCONTROLLER_H

#include "composerengine.h"
#include "composerintent.h"
#include "composersettings.h"
#include "editingsession.h"
#include "projectionrenderer.h"

#include <QObject>
#include <QQueue>

#include <functional>

class TextViewHost;

class SyncController : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Dispatching,    // waiting for the engine
        Applying,       // writing the result into the view
        Faulted         // engine call failed; returns to Idle
    };

    // engine and host are not owned and must outlive the controller
    SyncController(ComposerEngine *engine, TextViewHost *host,
                   const ComposerSettings &settings = ComposerSettings(),
                   QObject *parent = nullptr);

    void setMentionDisplayHandler(MentionDisplayHandler *handler);

    // Starts from an empty engine document. Closing drops all session caches.
    bool openSession();
    void closeSession();

    // Returns false when the intent was refused or the engine failed
    bool dispatch(const ComposerIntent &intent);

    // Selection reported by the view, in view offsets
    void viewSelectionChanged(int viewStart, int viewEnd);

    // Queued and applied in arrival order, each to completion
    void processSnapshot(const Projection::Snapshot &snapshot);

    // Re-renders the engine's projections and replaces the whole view
    void requestFullResync();

    State state() const { return m_state; }
    static QString stateName(State state);

    const Projection::MenuStateUpdate &actionStates() const { return m_session.actionStates(); }
    Projection::ActionState actionState(Projection::ComposerAction action) const;
    const std::optional<Projection::SuggestionPattern> &suggestionPattern() const
    {
        return m_session.suggestionPattern();
    }

    EditingSession &session() { return m_session; }
    const IndexMapper &mapper() const { return m_session.mapper(); }
    const ProjectionRenderer &renderer() const { return m_renderer; }
    const ComposerSettings &settings() const { return m_settings; }

Q_SIGNALS:
    void actionStatesChanged();
    void suggestionPatternChanged();
    void textApplied();
    void selectionApplied(int viewStart, int viewEnd);
    // A view offset could not be mapped; the view should be re-synced
    void resyncRequested();
    void engineFaulted(const QString &intent, const QString &message);

private:
    bool runEngineCall(const QString &name,
                       const std::function<std::optional<Projection::ComposerUpdate>()> &call);
    std::optional<Projection::ComposerUpdate> callEngine(const ComposerIntent &intent);

    void applyUpdate(const Projection::ComposerUpdate &update);
    void applyTextUpdate(const Projection::TextUpdate &update);
    void applyMenuAction(const Projection::MenuAction &action);
    void mergeMenuState(const Projection::MenuStateUpdate &update);

    void refreshView(const QList<Projection::BlockProjection> &blocks, bool allowPatching);
    bool patchView(const RenderResult &rendered);
    void applySelection(const Projection::TextRange &modelRange);
    void applySnapshot(const Projection::Snapshot &snapshot);
    void drainSnapshots();
    void markDiverged(const char *what);

    ComposerEngine *m_engine;
    TextViewHost *m_host;
    ComposerSettings m_settings;
    ProjectionRenderer m_renderer;
    EditingSession m_session;
    State m_state = State::Idle;
    QQueue<Projection::Snapshot> m_pendingSnapshots;
    bool m_resyncPending = false;
};

#endif // RICHCOMPOSER_SYNCCONTROLLER_H
